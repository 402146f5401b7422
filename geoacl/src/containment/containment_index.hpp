#pragma once
#include "catalog/catalog.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace containment {

    /**
     * Immutable view of the membership graph at one point in time. A decision that needs several
     * lookups takes one snapshot so they all agree with each other.
     */
    class ContainmentSnapshot {
        friend class ContainmentIndex;

        // group -> direct members, in catalog order
        std::unordered_map<std::string, std::vector<std::string>> _members;
        // resource -> groups it is a direct member of
        std::unordered_map<std::string, std::set<std::string>> _parents;
        // resource -> every group containing it, directly or through nested groups
        std::unordered_map<std::string, std::set<std::string>> _closure;
        std::set<std::string> _resources;

        [[nodiscard]] std::set<std::string> ancestorsOf(const std::string &id) const;
        [[nodiscard]] std::vector<std::string> descendantsOf(const std::string &id) const;
        void refreshClosure(const std::string &id);
        void refreshSubtree(const std::string &id);
        [[nodiscard]] bool sameEdges(const std::string &left, const std::string &right) const;

        void added(
            const std::string &id, const std::vector<std::string> &parents, catalog::ResourceKind kind);
        void detached(const std::string &id, const std::vector<std::string> &groups);
        void removed(const std::string &id);
        void renamed(const std::string &oldId, const std::string &newId);
        void applyEvent(const catalog::CatalogEvent &event);

    public:
        [[nodiscard]] std::set<std::string> groupsContaining(const std::string &id) const;
        [[nodiscard]] std::vector<std::string> membersOf(const std::string &groupId) const;
        [[nodiscard]] bool isGroup(const std::string &id) const;
        [[nodiscard]] bool contains(const std::string &id) const;
        [[nodiscard]] size_t size() const noexcept {
            return _resources.size();
        }
    };

    /**
     * Reverse index from each resource to the groups that transitively contain it.
     *
     * Built by walking the catalog once, then maintained from catalog events. Writers are
     * serialised and work on a private copy which replaces the published snapshot in one step,
     * so readers see a mutation (or a batch of them) entirely or not at all and are never held
     * up by the recomputation.
     */
    class ContainmentIndex : public catalog::CatalogListener {
        mutable std::shared_mutex _mutex;
        std::mutex _writerMutex;
        std::shared_ptr<const ContainmentSnapshot> _current;
        std::atomic_bool _ready{false};
        std::atomic_bool _degraded{false};

        static std::shared_ptr<ContainmentSnapshot> walk(const catalog::Catalog &catalog);
        void publish(std::shared_ptr<const ContainmentSnapshot> next);

    public:
        ContainmentIndex();

        /**
         * Startup build. Any failure raises errors::ContainmentIndexUnavailable and leaves the
         * index not ready.
         */
        void build(const catalog::Catalog &catalog);

        /**
         * Runtime refresh. On failure the previous snapshot stays in service, the index is
         * flagged degraded and false is returned.
         */
        bool rebuild(const catalog::Catalog &catalog);

        [[nodiscard]] std::shared_ptr<const ContainmentSnapshot> snapshot() const;

        [[nodiscard]] std::set<std::string> groupsContaining(const std::string &id) const {
            return snapshot()->groupsContaining(id);
        }
        [[nodiscard]] std::vector<std::string> membersOf(const std::string &groupId) const {
            return snapshot()->membersOf(groupId);
        }
        [[nodiscard]] bool isGroup(const std::string &id) const {
            return snapshot()->isGroup(id);
        }

        void resourceAdded(
            const std::string &id,
            const std::vector<std::string> &parents,
            catalog::ResourceKind kind = catalog::ResourceKind::LAYER);
        void resourceDetached(const std::string &id, const std::vector<std::string> &groups);
        void resourceRemoved(const std::string &id);
        void resourceRenamed(const std::string &oldId, const std::string &newId);

        /**
         * Applies the events in order as one atomic update. A membership that would make a group
         * contain itself raises errors::ContainmentCycle and none of the events are applied.
         */
        void apply(const std::vector<catalog::CatalogEvent> &events);

        /**
         * Listener entry point. A batch apply() rejects is logged and flags the index degraded;
         * nothing is raised back into the catalog.
         */
        void onCatalogEvents(const std::vector<catalog::CatalogEvent> &events) override;

        [[nodiscard]] bool ready() const noexcept {
            return _ready.load();
        }
        [[nodiscard]] bool degraded() const noexcept {
            return _degraded.load();
        }
    };

} // namespace containment
