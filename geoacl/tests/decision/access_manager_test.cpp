#include "catalog/memory_catalog.hpp"
#include "decision/access_manager.hpp"
#include "errors/error_base.hpp"
#include "support/fake_transport.hpp"
#include "support/log_capture.hpp"
#include <catch2/catch_all.hpp>
#include <atomic>
#include <thread>

using decision::Decision;
using decision::DenyReason;
using rules::AccessMode;
using rules::Rule;

// NOLINTBEGIN
namespace {
    request::DecisionKey capabilities(std::set<std::string> roles, std::string group) {
        return request::DecisionKey{"user", std::move(roles), "WMS", "GETCAPABILITIES", {}, std::move(group)};
    }

    request::DecisionKey transaction(std::string ws, std::string layer) {
        return request::DecisionKey{"user", {"ROLE_USER"}, "WFS", "TRANSACTION", std::move(ws), std::move(layer)};
    }
} // namespace

SCENARIO("Access manager lifecycle", "[decision][manager]") {
    GIVEN("A catalog with one group and an internal rule table") {
        catalog::MemoryCatalog resources;
        resources.addGroup("base");
        resources.addLayer("topp:A", {"base"});
        auto ruleStore = std::make_shared<rules::LocalRuleStore>();
        ruleStore->add(Rule::allow("*", "*", AccessMode::READ));
        auto transport = std::make_shared<test_support::FakeTransport>();

        test_support::LogCapture capture{logging::Level::Info};
        decision::AccessManager manager{config::AccessManagerConfig{}, ruleStore, resources, transport};

        THEN("It starts with the index built") {
            REQUIRE(manager.index().ready());
            REQUIRE(capture.hasEvent("access-manager-started"));
            REQUIRE(manager.config()->isInternal());
            REQUIRE(manager.decide(capabilities({}, "base")) == Decision::allowFiltered({"topp:A"}));
        }
        WHEN("The catalog gains a member") {
            resources.addLayer("topp:B", {"base"});
            THEN("The next listing includes it") {
                REQUIRE(
                    manager.decide(capabilities({}, "base"))
                    == Decision::allowFiltered({"topp:A", "topp:B"}));
            }
        }
        WHEN("A member is renamed") {
            resources.rename("topp:A", "topp:Z");
            THEN("The listing uses the new name") {
                REQUIRE(manager.decide(capabilities({}, "base")) == Decision::allowFiltered({"topp:Z"}));
            }
        }
        WHEN("A rule is added to the local table") {
            manager.localRules().add(Rule::deny("topp", "A", AccessMode::READ, {}, 5));
            THEN("It takes effect immediately") {
                REQUIRE(manager.decide(capabilities({}, "base")) == Decision::allowFiltered({}));
            }
        }
        WHEN("Write is granted to authenticated users") {
            auto next = *manager.config();
            next.grantWriteToAuthenticatedUsers = true;
            REQUIRE(manager.decide(transaction("topp", "A")).isDenied());
            manager.updateConfig(next);
            THEN("The next decision uses the new setting") {
                REQUIRE(manager.config()->grantWriteToAuthenticatedUsers);
                REQUIRE(manager.decide(transaction("topp", "A")) == Decision::allow());
                REQUIRE(capture.hasEvent("config-updated"));
            }
        }
        WHEN("An update names an unreachable remote service") {
            transport->fail(errors::ServiceUnavailable::Failure::CONNECT);
            config::AccessManagerConfig next;
            next.serviceUrl = "http://acl.invalid";
            THEN("It is rejected and the current configuration stays") {
                REQUIRE_THROWS_AS(manager.updateConfig(next), errors::ServiceUnavailable);
                REQUIRE(manager.config()->isInternal());
                REQUIRE(capture.hasEvent("config-rejected"));
                REQUIRE(manager.decide(capabilities({}, "base")).isAllowed());
            }
        }
        WHEN("An update is not valid") {
            config::AccessManagerConfig next;
            next.serviceUrl = "ldap://directory";
            THEN("It is rejected before anything is contacted") {
                REQUIRE_THROWS_AS(manager.testConfig(next), errors::ConfigError);
                REQUIRE_THROWS_AS(manager.updateConfig(next), errors::ConfigError);
                REQUIRE(transport->calls().empty());
            }
        }
        WHEN("An update names a reachable remote service") {
            transport->respond(200, R"({"rules":[{"access":"WRITE","workspace":"topp"}]})");
            config::AccessManagerConfig next;
            next.serviceUrl = "http://acl.example";
            manager.updateConfig(next);
            THEN("Decisions come from the remote service") {
                REQUIRE(manager.config()->serviceUrl == "http://acl.example");
                REQUIRE(manager.decide(transaction("topp", "A")) == Decision::allow());
                REQUIRE(transport->calls().back().url == "http://acl.example/rules/query");
            }
        }
        WHEN("The catalog becomes unreadable and the index is refreshed") {
            resources.setAvailable(false);
            THEN("The last known index keeps serving") {
                REQUIRE_FALSE(manager.refreshIndex());
                REQUIRE(manager.index().degraded());
                REQUIRE(manager.decide(capabilities({}, "base")) == Decision::allowFiltered({"topp:A"}));
            }
        }
    }
    GIVEN("A catalog that cannot be read at startup") {
        catalog::MemoryCatalog resources;
        resources.setAvailable(false);
        test_support::LogCapture capture{logging::Level::None};
        THEN("The manager does not start") {
            REQUIRE_THROWS_AS(
                decision::AccessManager(config::AccessManagerConfig{}, nullptr, resources),
                errors::ContainmentIndexUnavailable);
        }
    }
    GIVEN("An invalid startup configuration") {
        catalog::MemoryCatalog resources;
        config::AccessManagerConfig settings;
        settings.adminRole = "";
        THEN("The manager does not start") {
            REQUIRE_THROWS_AS(
                decision::AccessManager(settings, nullptr, resources), errors::ConfigError);
        }
    }
}

SCENARIO("Configuration swaps during decisions", "[decision][concurrency]") {
    GIVEN("A manager flipping between an internal and a remote configuration") {
        catalog::MemoryCatalog resources;
        resources.addGroup("base");
        resources.addLayer("topp:A", {"base"});
        auto ruleStore = std::make_shared<rules::LocalRuleStore>();
        ruleStore->add(Rule::allow("*", "*", AccessMode::READ));
        auto transport = std::make_shared<test_support::FakeTransport>();
        transport->respond(200, R"({"rules":[]})");

        test_support::LogCapture capture{logging::Level::None};
        config::AccessManagerConfig internal;
        config::AccessManagerConfig remote;
        remote.serviceUrl = "http://acl.example";
        remote.grantWriteToAuthenticatedUsers = true;
        decision::AccessManager manager{internal, ruleStore, resources, transport};

        std::atomic_bool done{false};
        std::atomic_int mixed{0};
        std::vector<std::thread> readers;
        for(int t = 0; t < 3; ++t) {
            readers.emplace_back([&]() {
                do {
                    auto engine = manager.engine();
                    const auto &settings = engine->config();
                    auto store = engine->ruleStore().describe();
                    bool isRemote = !settings.isInternal();
                    if(settings.grantWriteToAuthenticatedUsers != isRemote
                       || store != (isRemote ? "http://acl.example" : "internal")) {
                        ++mixed;
                    }
                    // Only the remote configuration grants the write
                    if(engine->decide(transaction("topp", "A")).isAllowed() != isRemote) {
                        ++mixed;
                    }
                    auto current = manager.config();
                    if(current->grantWriteToAuthenticatedUsers == current->isInternal()) {
                        ++mixed;
                    }
                } while(!done.load());
            });
        }
        for(int i = 0; i < 100; ++i) {
            manager.updateConfig(i % 2 == 0 ? remote : internal);
        }
        done.store(true);
        for(auto &reader : readers) {
            reader.join();
        }

        THEN("Readers only ever see a configuration together with its own rule store") {
            REQUIRE(mixed.load() == 0);
            REQUIRE(manager.config()->isInternal());
            REQUIRE(manager.engine()->ruleStore().describe() == "internal");
        }
    }
}
// NOLINTEND
