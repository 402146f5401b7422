#include "decision/operation_classifier.hpp"
#include <catch2/catch_all.hpp>

using rules::AccessMode;

// NOLINTBEGIN
SCENARIO("Operations are classified by required access", "[decision]") {
    GIVEN("The built-in table") {
        decision::OperationClassifier classifier;
        THEN("Mutating operations need WRITE") {
            REQUIRE(classifier.classify("WFS", "TRANSACTION").access == AccessMode::WRITE);
            REQUIRE(classifier.classify("WFS", "LOCKFEATURE").access == AccessMode::WRITE);
            REQUIRE(classifier.classify("WCS-T", "ANYTHING").access == AccessMode::WRITE);
            REQUIRE(classifier.classify("REST", "DELETE").access == AccessMode::WRITE);
        }
        THEN("Everything else needs READ") {
            REQUIRE(classifier.classify("WFS", "GETFEATURE").access == AccessMode::READ);
            REQUIRE(classifier.classify("REST", "GET").access == AccessMode::READ);
            REQUIRE(classifier.classify("", "").access == AccessMode::READ);
        }
        THEN("Capabilities and maps list group members") {
            REQUIRE(classifier.classify("WMS", "GETCAPABILITIES").listing);
            REQUIRE(classifier.classify("WFS", "GETCAPABILITIES").listing);
            REQUIRE(classifier.classify("WMS", "GETMAP").listing);
            REQUIRE_FALSE(classifier.classify("WMS", "GETFEATUREINFO").listing);
        }
    }
    GIVEN("Configured mappings") {
        decision::OperationClassifier classifier{{
            {"WPS", "*", AccessMode::WRITE, false},
            {"WPS", "GETCAPABILITIES", AccessMode::READ, true},
            {"WFS", "TRANSACTION", AccessMode::ADMIN, false},
        }};
        THEN("An exact mapping wins over the service wildcard") {
            auto c = classifier.classify("WPS", "GETCAPABILITIES");
            REQUIRE(c.access == AccessMode::READ);
            REQUIRE(c.listing);
            REQUIRE(classifier.classify("WPS", "EXECUTE").access == AccessMode::WRITE);
        }
        THEN("A mapping overrides the built-in table") {
            REQUIRE(classifier.classify("WFS", "TRANSACTION").access == AccessMode::ADMIN);
            REQUIRE(classifier.classify("WFS", "LOCKFEATURE").access == AccessMode::WRITE);
        }
    }
}
// NOLINTEND
