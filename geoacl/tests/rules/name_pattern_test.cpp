#include "errors/error_base.hpp"
#include "rules/address_range.hpp"
#include "rules/name_pattern.hpp"
#include <catch2/catch_all.hpp>

// NOLINTBEGIN
SCENARIO("Name patterns", "[rules]") {
    GIVEN("The global wildcard") {
        auto pattern = rules::NamePattern::compile("*");
        THEN("It matches anything, including an unset value") {
            REQUIRE(pattern.isAny());
            REQUIRE(pattern.matches(std::string_view("states")));
            REQUIRE(pattern.matches(std::optional<std::string>{}));
            REQUIRE(pattern.specificity() == 0);
        }
    }
    GIVEN("An exact name") {
        auto pattern = rules::NamePattern::compile("states");
        THEN("Only that name matches") {
            REQUIRE(pattern.kind() == rules::NamePattern::Kind::EXACT);
            REQUIRE(pattern.matches(std::string_view("states")));
            REQUIRE_FALSE(pattern.matches(std::string_view("states2")));
            REQUIRE_FALSE(pattern.matches(std::optional<std::string>{}));
            REQUIRE(pattern.specificity() == 2);
        }
    }
    GIVEN("Glob patterns") {
        THEN("A prefix glob matches names with that prefix") {
            auto pattern = rules::NamePattern::compile("roads_*");
            REQUIRE(pattern.kind() == rules::NamePattern::Kind::GLOB);
            REQUIRE(pattern.matches(std::string_view("roads_2024")));
            REQUIRE(pattern.matches(std::string_view("roads_")));
            REQUIRE_FALSE(pattern.matches(std::string_view("rail_2024")));
            REQUIRE(pattern.specificity() == 1);
        }
        THEN("A suffix glob matches names with that suffix") {
            auto pattern = rules::NamePattern::compile("*_2024");
            REQUIRE(pattern.matches(std::string_view("roads_2024")));
            REQUIRE_FALSE(pattern.matches(std::string_view("roads_2023")));
        }
        THEN("Inner wildcards match in order") {
            auto pattern = rules::NamePattern::compile("a*b*c");
            REQUIRE(pattern.matches(std::string_view("abc")));
            REQUIRE(pattern.matches(std::string_view("axxbyyc")));
            REQUIRE_FALSE(pattern.matches(std::string_view("acb")));
            REQUIRE_FALSE(pattern.matches(std::string_view("ab")));
        }
    }
    GIVEN("Escaped special characters") {
        auto pattern = rules::NamePattern::compile("price${*}");
        THEN("They are matched literally") {
            REQUIRE(pattern.kind() == rules::NamePattern::Kind::EXACT);
            REQUIRE(pattern.matches(std::string_view("price*")));
            REQUIRE_FALSE(pattern.matches(std::string_view("price_list")));
        }
    }
    GIVEN("Case-insensitive compilation") {
        auto pattern = rules::NamePattern::compile("GetMap", true);
        THEN("The pattern is upper-cased") {
            REQUIRE(pattern.source() == "GETMAP");
            REQUIRE(pattern.matches(std::string_view("GETMAP")));
        }
    }
    GIVEN("Invalid patterns") {
        THEN("They are rejected") {
            REQUIRE_THROWS_AS(rules::NamePattern::compile(""), errors::RuleError);
            REQUIRE_THROWS_AS(rules::NamePattern::compile("states?"), errors::RuleError);
            REQUIRE_THROWS_AS(rules::NamePattern::compile("bad${x}"), errors::RuleError);
        }
    }
}

SCENARIO("Address ranges", "[rules]") {
    GIVEN("An IPv4 network") {
        auto range = rules::AddressRange::parse("10.1.0.0/16");
        THEN("Addresses inside match and others do not") {
            REQUIRE(range.contains(std::string_view("10.1.2.3")));
            REQUIRE_FALSE(range.contains(std::string_view("10.2.0.1")));
            REQUIRE_FALSE(range.contains(std::string_view("not-an-address")));
            REQUIRE_FALSE(range.contains(std::optional<std::string>{}));
        }
    }
    GIVEN("A prefix that is not byte aligned") {
        auto range = rules::AddressRange::parse("192.168.0.0/23");
        THEN("The partial byte is honoured") {
            REQUIRE(range.contains(std::string_view("192.168.1.200")));
            REQUIRE_FALSE(range.contains(std::string_view("192.168.2.1")));
        }
    }
    GIVEN("An IPv6 network") {
        auto range = rules::AddressRange::parse("2001:db8::/32");
        THEN("Only addresses of that family and prefix match") {
            REQUIRE(range.contains(std::string_view("2001:db8::1")));
            REQUIRE_FALSE(range.contains(std::string_view("2001:db9::1")));
            REQUIRE_FALSE(range.contains(std::string_view("10.0.0.1")));
        }
    }
    GIVEN("A bare address") {
        auto range = rules::AddressRange::parse("127.0.0.1");
        THEN("It is a single host") {
            REQUIRE(range.contains(std::string_view("127.0.0.1")));
            REQUIRE_FALSE(range.contains(std::string_view("127.0.0.2")));
        }
    }
    GIVEN("Malformed ranges") {
        THEN("They are rejected") {
            REQUIRE_THROWS_AS(rules::AddressRange::parse("10.0.0.0/33"), errors::RuleError);
            REQUIRE_THROWS_AS(rules::AddressRange::parse("10.0.0/8"), errors::RuleError);
            REQUIRE_THROWS_AS(rules::AddressRange::parse("10.0.0.0/"), errors::RuleError);
        }
    }
}
// NOLINTEND
