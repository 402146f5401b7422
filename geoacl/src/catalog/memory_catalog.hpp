#pragma once
#include "catalog/catalog.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace catalog {

    /**
     * In-memory catalog with change notification. Mutations are serialised; listeners are told
     * about each mutation (or each batch) before the mutating call returns.
     */
    class MemoryCatalog : public Catalog {
        mutable std::shared_mutex _mutex;
        // Serialises writers, including listener notification. Recursive so that batch()
        // callbacks can use the ordinary mutators.
        std::recursive_mutex _writerMutex;
        std::vector<ResourceInfo> _resources;
        std::unordered_map<std::string, std::vector<std::string>> _members;
        std::vector<CatalogListener *> _listeners;
        std::atomic_bool _available{true};
        int _batchDepth{0};
        std::vector<CatalogEvent> _pending;

        void checkAvailable() const;
        [[nodiscard]] bool existsLocked(const std::string &id) const;
        [[nodiscard]] bool isGroupLocked(const std::string &id) const;
        [[nodiscard]] bool containsLocked(const std::string &groupId, const std::string &id) const;
        void publish(CatalogEvent event);
        void flushPending();
        void notify(const std::vector<CatalogEvent> &events);

    public:
        MemoryCatalog() = default;

        [[nodiscard]] std::vector<ResourceInfo> resources() const override;
        [[nodiscard]] std::optional<ResourceInfo> find(const std::string &id) const override;
        [[nodiscard]] std::vector<std::string> membersOf(const std::string &groupId) const override;
        [[nodiscard]] CatalogView view() const override;

        /**
         * Adds a resource, optionally as a direct member of existing groups.
         * Raises std::invalid_argument for a duplicate id, an unknown parent, or a parent that
         * is not a group.
         */
        void add(
            const std::string &id,
            ResourceKind kind = ResourceKind::LAYER,
            const std::vector<std::string> &parents = {});
        void addLayer(const std::string &id, const std::vector<std::string> &parents = {}) {
            add(id, ResourceKind::LAYER, parents);
        }
        void addGroup(const std::string &id, const std::vector<std::string> &parents = {}) {
            add(id, ResourceKind::GROUP, parents);
        }

        /**
         * Makes an existing resource a direct member of a group. Raises std::invalid_argument if
         * that would make a group contain itself.
         */
        void attach(const std::string &id, const std::string &groupId);
        void detach(const std::string &id, const std::string &groupId);
        void remove(const std::string &id);
        void rename(const std::string &oldId, const std::string &newId);

        /**
         * Runs several mutations and notifies listeners once with all of them.
         */
        void batch(const std::function<void(MemoryCatalog &)> &mutations);

        void addListener(CatalogListener &listener) override;
        void removeListener(CatalogListener &listener) override;

        /**
         * Simulates the backing store going away: reads raise errors::CatalogUnavailable.
         */
        void setAvailable(bool available) {
            _available.store(available);
        }
    };

} // namespace catalog
