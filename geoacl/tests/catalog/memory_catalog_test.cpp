#include "catalog/memory_catalog.hpp"
#include "errors/error_base.hpp"
#include "support/log_capture.hpp"
#include <catch2/catch_all.hpp>

using catalog::CatalogEvent;

// NOLINTBEGIN
namespace {
    class RecordingListener : public catalog::CatalogListener {
    public:
        std::vector<std::vector<CatalogEvent>> received;

        void onCatalogEvents(const std::vector<CatalogEvent> &events) override {
            received.push_back(events);
        }
    };
} // namespace

SCENARIO("Memory catalog mutations", "[catalog]") {
    GIVEN("A catalog with a group and a listener") {
        catalog::MemoryCatalog store;
        RecordingListener listener;
        store.addGroup("G");
        store.addListener(listener);

        WHEN("A layer is added into the group") {
            store.addLayer("A", {"G"});
            THEN("It is a member and one event is published") {
                REQUIRE(store.membersOf("G") == std::vector<std::string>{"A"});
                REQUIRE(store.find("A")->kind == catalog::ResourceKind::LAYER);
                REQUIRE(listener.received.size() == 1);
                REQUIRE(listener.received[0][0].type == CatalogEvent::Type::ADDED);
                REQUIRE(listener.received[0][0].parents == std::vector<std::string>{"G"});
            }
        }
        WHEN("A group is renamed and the catalog is read in full") {
            store.addLayer("A", {"G"});
            store.rename("G", "G2");
            auto view = store.view();
            THEN("Resources and memberships agree on the new name") {
                REQUIRE(view.resources.size() == 2);
                REQUIRE(view.members.count("G") == 0);
                REQUIRE(view.members.at("G2") == std::vector<std::string>{"A"});
            }
        }
        WHEN("A resource is added twice") {
            store.addLayer("A");
            THEN("The duplicate is rejected") {
                REQUIRE_THROWS_AS(store.addLayer("A"), std::invalid_argument);
                REQUIRE(listener.received.size() == 1);
            }
        }
        WHEN("A resource names a parent that is a layer") {
            store.addLayer("L");
            THEN("It is rejected") {
                REQUIRE_THROWS_AS(store.addLayer("A", {"L"}), std::invalid_argument);
                REQUIRE_THROWS_AS(store.addLayer("A", {"missing"}), std::invalid_argument);
            }
        }
        WHEN("A group is attached into its own member") {
            store.addGroup("H", {"G"});
            THEN("The cycle is refused") {
                REQUIRE_THROWS_AS(store.attach("G", "H"), std::invalid_argument);
                REQUIRE_THROWS_AS(store.attach("G", "G"), std::invalid_argument);
                REQUIRE(store.membersOf("H").empty());
            }
        }
        WHEN("A group is attached to another group") {
            store.addGroup("H");
            store.attach("H", "G");
            THEN("The event carries the group kind") {
                REQUIRE(listener.received.back()[0].kind == catalog::ResourceKind::GROUP);
            }
        }
        WHEN("A member is detached and then removed") {
            store.addLayer("A", {"G"});
            store.detach("A", "G");
            store.detach("A", "G");
            store.remove("A");
            THEN("Each effective change is published once") {
                REQUIRE(listener.received.size() == 3);
                REQUIRE(listener.received[1][0].type == CatalogEvent::Type::DETACHED);
                REQUIRE(listener.received[2][0].type == CatalogEvent::Type::REMOVED);
                REQUIRE_FALSE(store.find("A").has_value());
            }
        }
        WHEN("A member is renamed") {
            store.addLayer("A", {"G"});
            store.rename("A", "B");
            THEN("Memberships follow the new name") {
                REQUIRE(store.membersOf("G") == std::vector<std::string>{"B"});
                REQUIRE(listener.received.back()[0].newId == "B");
                REQUIRE_THROWS_AS(store.rename("B", "G"), std::invalid_argument);
            }
        }
        WHEN("Several mutations run as a batch") {
            store.batch([](catalog::MemoryCatalog &c) {
                c.addLayer("A", {"G"});
                c.addLayer("B", {"G"});
            });
            THEN("The listener hears about them together") {
                REQUIRE(listener.received.size() == 1);
                REQUIRE(listener.received[0].size() == 2);
            }
        }
        WHEN("A batch fails halfway") {
            test_support::LogCapture capture{logging::Level::Warn};
            REQUIRE_THROWS_AS(
                store.batch([](catalog::MemoryCatalog &c) {
                    c.addLayer("A", {"G"});
                    c.addLayer("A");
                }),
                std::invalid_argument);
            THEN("What was applied is still published") {
                REQUIRE(listener.received.size() == 1);
                REQUIRE(listener.received[0].size() == 1);
                REQUIRE(capture.hasEvent("catalog-batch-failed"));
            }
        }
        WHEN("The listener is removed") {
            store.removeListener(listener);
            store.addLayer("A");
            THEN("It is not notified") {
                REQUIRE(listener.received.empty());
            }
        }
        WHEN("The backing store is unavailable") {
            store.setAvailable(false);
            THEN("Reads fail") {
                REQUIRE_THROWS_AS(store.resources(), errors::CatalogUnavailable);
                REQUIRE_THROWS_AS(store.membersOf("G"), errors::CatalogUnavailable);
                REQUIRE_THROWS_AS(store.view(), errors::CatalogUnavailable);
            }
        }
    }
}
// NOLINTEND
