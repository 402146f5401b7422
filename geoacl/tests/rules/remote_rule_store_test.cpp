#include "errors/error_base.hpp"
#include "rules/remote_rule_store.hpp"
#include "rules/rule_codec.hpp"
#include "support/fake_transport.hpp"
#include "support/log_capture.hpp"
#include "support/silent_server.hpp"
#include <catch2/catch_all.hpp>
#include <rapidjson/document.h>
#include <thread>

using namespace std::chrono_literals;

// NOLINTBEGIN
namespace {
    request::DecisionKey statesKey() {
        return request::DecisionKey{
            "alice", {"ROLE_ONE"}, "WMS", "GETMAP", "topp", "states", {}, "10.0.0.7"};
    }
} // namespace

SCENARIO("Remote rule store queries", "[rules][remote]") {
    GIVEN("A remote store over a scripted transport") {
        auto transport = std::make_shared<test_support::FakeTransport>();
        rules::RemoteRuleStore store{"http://acl.example/", 750ms, transport};

        WHEN("The backend answers with rules") {
            transport->respond(200, R"({"rules":[
                {"id":2,"priority":0,"grant":"ALLOW","access":"READ"},
                {"id":7,"priority":0,"grant":"DENY","access":"WRITE","workspace":"topp","layer":"states"},
                {"id":5,"priority":3,"access":"READ","roles":["ROLE_ONE"],"service":"wms"}
            ]})");
            auto matching = store.matchingRules(statesKey());
            THEN("The query goes to the rules endpoint with the bounded timeout") {
                auto calls = transport->calls();
                REQUIRE(calls.size() == 1);
                REQUIRE(calls[0].url == "http://acl.example/rules/query");
                REQUIRE(calls[0].timeout == 750ms);
            }
            THEN("The request carries the key") {
                rapidjson::Document doc;
                doc.Parse(transport->calls()[0].body.c_str());
                REQUIRE(std::string(doc["user"].GetString()) == "alice");
                REQUIRE(std::string(doc["request"].GetString()) == "GETMAP");
                REQUIRE(std::string(doc["layer"].GetString()) == "states");
                REQUIRE(std::string(doc["sourceAddress"].GetString()) == "10.0.0.7");
                REQUIRE_FALSE(doc.HasMember("subfield"));
            }
            THEN("Rules come back in store order") {
                REQUIRE(matching.size() == 3);
                REQUIRE(matching[0].id == 5);
                REQUIRE(matching[1].id == 7);
                REQUIRE(matching[2].id == 2);
                REQUIRE(matching[1].grant == rules::Grant::DENY);
                REQUIRE(matching[0].service.matches(std::string_view("WMS")));
            }
        }
        WHEN("The backend answers with no rules") {
            transport->respond(200, R"({"rules":[]})");
            THEN("The result is empty, not an error") {
                REQUIRE(store.matchingRules(statesKey()).empty());
            }
        }
        WHEN("The backend answers with an error status") {
            transport->respond(503, "busy");
            THEN("The store is unavailable") {
                try {
                    static_cast<void>(store.matchingRules(statesKey()));
                    FAIL("Expected ServiceUnavailable");
                } catch(const errors::ServiceUnavailable &e) {
                    REQUIRE(e.failure() == errors::ServiceUnavailable::Failure::BAD_STATUS);
                }
            }
        }
        WHEN("The backend answers with garbage") {
            test_support::LogCapture capture{logging::Level::Error};
            transport->respond(200, "{\"rules\": [");
            THEN("The store is unavailable and the problem is logged") {
                try {
                    static_cast<void>(store.matchingRules(statesKey()));
                    FAIL("Expected ServiceUnavailable");
                } catch(const errors::ServiceUnavailable &e) {
                    REQUIRE(e.failure() == errors::ServiceUnavailable::Failure::BAD_RESPONSE);
                }
                REQUIRE(capture.hasEvent("remote-rules-malformed"));
            }
        }
        WHEN("The transport cannot connect") {
            transport->fail(errors::ServiceUnavailable::Failure::CONNECT);
            THEN("The failure propagates as unavailable") {
                REQUIRE_THROWS_AS(store.matchingRules(statesKey()), errors::ServiceUnavailable);
            }
        }
        WHEN("The call is already cancelled") {
            auto token = tasks::CancellationToken::create();
            token.cancel();
            THEN("Nothing is sent") {
                REQUIRE_THROWS_AS(store.matchingRules(statesKey(), token), errors::Cancelled);
                REQUIRE(transport->calls().empty());
            }
        }
    }
    GIVEN("Invalid construction arguments") {
        THEN("They are rejected") {
            REQUIRE_THROWS_AS(
                rules::RemoteRuleStore("http://acl.example", 0ms, std::make_shared<test_support::FakeTransport>()),
                errors::ConfigError);
            REQUIRE_THROWS_AS(
                rules::RemoteRuleStore("http://acl.example", 10ms, nullptr), errors::ConfigError);
        }
    }
}

SCENARIO("Rule wire decoding", "[rules][remote]") {
    GIVEN("Malformed rule documents") {
        THEN("Each is rejected") {
            REQUIRE_THROWS_AS(rules::RuleCodec::decodeRules("[]"), errors::RuleError);
            REQUIRE_THROWS_AS(rules::RuleCodec::decodeRules(R"({"rules":{}})"), errors::RuleError);
            REQUIRE_THROWS_AS(
                rules::RuleCodec::decodeRules(R"({"rules":[{"access":"FLY"}]})"), errors::RuleError);
            REQUIRE_THROWS_AS(
                rules::RuleCodec::decodeRules(R"({"rules":[{"priority":"high"}]})"),
                errors::RuleError);
            REQUIRE_THROWS_AS(
                rules::RuleCodec::decodeRules(R"({"rules":[{"addressRange":"10.0.0.0/99"}]})"),
                errors::RuleError);
        }
    }
    GIVEN("A rule with every field left out") {
        auto decoded = rules::RuleCodec::decodeRules(R"({"rules":[{}]})");
        THEN("It is an ALLOW READ rule on everything") {
            REQUIRE(decoded.size() == 1);
            REQUIRE(decoded[0].grant == rules::Grant::ALLOW);
            REQUIRE(decoded[0].access == rules::AccessMode::READ);
            REQUIRE(decoded[0].workspace.isAny());
            REQUIRE(decoded[0].layer.isAny());
            REQUIRE(decoded[0].roles.empty());
        }
    }
}

SCENARIO("Remote rule store over libcurl", "[rules][remote][curl]") {
    GIVEN("A backend that accepts connections and never answers") {
        test_support::SilentServer server;
        rules::RemoteRuleStore store{server.url(), 300ms, rules::CurlTransport::create()};

        WHEN("A query is made") {
            auto started = std::chrono::steady_clock::now();
            std::optional<errors::ServiceUnavailable::Failure> failure;
            try {
                static_cast<void>(store.matchingRules(statesKey()));
            } catch(const errors::ServiceUnavailable &e) {
                failure = e.failure();
            }
            auto elapsed = std::chrono::steady_clock::now() - started;
            THEN("It times out as unavailable within a bounded time") {
                REQUIRE(failure == errors::ServiceUnavailable::Failure::TIMEOUT);
                REQUIRE(elapsed < 5s);
            }
        }
        WHEN("The query is cancelled while waiting") {
            auto token = tasks::CancellationToken::create();
            rules::RemoteRuleStore slow{server.url(), 10s, rules::CurlTransport::create()};
            std::thread canceller([token]() {
                std::this_thread::sleep_for(200ms);
                token.cancel();
            });
            auto started = std::chrono::steady_clock::now();
            bool cancelled = false;
            try {
                static_cast<void>(slow.matchingRules(statesKey(), token));
            } catch(const errors::Cancelled &) {
                cancelled = true;
            }
            canceller.join();
            THEN("The call is abandoned promptly") {
                REQUIRE(cancelled);
                REQUIRE(std::chrono::steady_clock::now() - started < 5s);
            }
        }
    }
}
// NOLINTEND
