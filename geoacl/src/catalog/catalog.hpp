#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace catalog {

    enum class ResourceKind { LAYER, GROUP };

    struct ResourceInfo {
        std::string id;
        ResourceKind kind{ResourceKind::LAYER};
    };

    /**
     * Resources and group memberships read together, so no mutation falls between them.
     */
    struct CatalogView {
        std::vector<ResourceInfo> resources;
        // group -> direct members, in catalog order
        std::unordered_map<std::string, std::vector<std::string>> members;
    };

    /**
     * One catalog mutation as seen by the containment index.
     * - ADDED: resource `id` now exists, as a direct member of every group in `parents`
     *   (repeated for an existing resource, it only attaches more parents)
     * - DETACHED: resource `id` is no longer a direct member of the groups in `parents`
     * - REMOVED: resource `id` is gone together with every edge to or from it
     * - RENAMED: resource `id` is now called `newId`; memberships are unchanged
     */
    struct CatalogEvent {
        enum class Type { ADDED, DETACHED, REMOVED, RENAMED };

        Type type{Type::ADDED};
        std::string id;
        std::vector<std::string> parents;
        std::string newId;
        ResourceKind kind{ResourceKind::LAYER};

        static CatalogEvent added(
            std::string id, std::vector<std::string> parents, ResourceKind kind = ResourceKind::LAYER) {
            return CatalogEvent{Type::ADDED, std::move(id), std::move(parents), {}, kind};
        }
        static CatalogEvent detached(std::string id, std::vector<std::string> groups) {
            return CatalogEvent{
                Type::DETACHED, std::move(id), std::move(groups), {}, ResourceKind::LAYER};
        }
        static CatalogEvent removed(std::string id) {
            return CatalogEvent{Type::REMOVED, std::move(id), {}, {}, ResourceKind::LAYER};
        }
        static CatalogEvent renamed(std::string oldId, std::string newId) {
            return CatalogEvent{
                Type::RENAMED, std::move(oldId), {}, std::move(newId), ResourceKind::LAYER};
        }
    };

    /**
     * Receives catalog mutations. Called synchronously by the mutating thread, so the listener
     * has been updated before the mutating call returns.
     */
    class CatalogListener {
    public:
        CatalogListener() = default;
        CatalogListener(const CatalogListener &) = delete;
        CatalogListener(CatalogListener &&) = delete;
        CatalogListener &operator=(const CatalogListener &) = delete;
        CatalogListener &operator=(CatalogListener &&) = delete;
        virtual ~CatalogListener() = default;

        virtual void onCatalogEvents(const std::vector<CatalogEvent> &events) = 0;
    };

    /**
     * Read-only view of the catalog used to build the containment index, plus registration for
     * its change events. Reads raise errors::CatalogUnavailable when the backing store cannot be
     * read.
     */
    class Catalog {
    public:
        Catalog() = default;
        Catalog(const Catalog &) = delete;
        Catalog(Catalog &&) = delete;
        Catalog &operator=(const Catalog &) = delete;
        Catalog &operator=(Catalog &&) = delete;
        virtual ~Catalog() = default;

        [[nodiscard]] virtual std::vector<ResourceInfo> resources() const = 0;
        [[nodiscard]] virtual std::optional<ResourceInfo> find(const std::string &id) const = 0;

        /**
         * Direct members of a group in catalog order; empty for a layer.
         */
        [[nodiscard]] virtual std::vector<std::string> membersOf(const std::string &groupId) const = 0;

        /**
         * Every resource and every group's members as of a single point in the catalog's
         * history.
         */
        [[nodiscard]] virtual CatalogView view() const = 0;

        virtual void addListener(CatalogListener &listener) = 0;
        virtual void removeListener(CatalogListener &listener) = 0;
    };

} // namespace catalog
