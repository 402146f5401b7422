#include "containment/containment_index.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include <algorithm>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.containment.ContainmentIndex");

namespace containment {

    std::set<std::string> ContainmentSnapshot::ancestorsOf(const std::string &id) const {
        std::set<std::string> ancestors;
        std::vector<std::string> pending{id};
        while(!pending.empty()) {
            auto current = pending.back();
            pending.pop_back();
            auto it = _parents.find(current);
            if(it == _parents.end()) {
                continue;
            }
            for(const auto &parent : it->second) {
                if(parent == id) {
                    throw errors::ContainmentCycle("Group would contain itself: " + id);
                }
                if(ancestors.insert(parent).second) {
                    pending.push_back(parent);
                }
            }
        }
        return ancestors;
    }

    std::vector<std::string> ContainmentSnapshot::descendantsOf(const std::string &id) const {
        std::vector<std::string> found;
        std::set<std::string> seen{id};
        std::vector<std::string> pending{id};
        while(!pending.empty()) {
            auto current = pending.back();
            pending.pop_back();
            auto it = _members.find(current);
            if(it == _members.end()) {
                continue;
            }
            for(const auto &member : it->second) {
                if(seen.insert(member).second) {
                    found.push_back(member);
                    pending.push_back(member);
                }
            }
        }
        return found;
    }

    void ContainmentSnapshot::refreshClosure(const std::string &id) {
        auto ancestors = ancestorsOf(id);
        if(ancestors.empty()) {
            _closure.erase(id);
        } else {
            _closure[id] = std::move(ancestors);
        }
    }

    void ContainmentSnapshot::refreshSubtree(const std::string &id) {
        refreshClosure(id);
        for(const auto &descendant : descendantsOf(id)) {
            refreshClosure(descendant);
        }
    }

    void ContainmentSnapshot::added(
        const std::string &id, const std::vector<std::string> &parents, catalog::ResourceKind kind) {
        _resources.insert(id);
        if(kind == catalog::ResourceKind::GROUP) {
            _members.try_emplace(id);
        }
        for(const auto &parent : parents) {
            if(parent == id) {
                throw errors::ContainmentCycle("Group would contain itself: " + id);
            }
            // A parent only ever seen as a target of a membership is still a group
            _resources.insert(parent);
            auto &members = _members[parent];
            if(std::find(members.begin(), members.end(), id) == members.end()) {
                members.push_back(id);
            }
            _parents[id].insert(parent);
        }
        refreshSubtree(id);
    }

    void ContainmentSnapshot::detached(const std::string &id, const std::vector<std::string> &groups) {
        auto parentsIt = _parents.find(id);
        for(const auto &group : groups) {
            if(auto it = _members.find(group); it != _members.end()) {
                auto &members = it->second;
                members.erase(std::remove(members.begin(), members.end(), id), members.end());
            }
            if(parentsIt != _parents.end()) {
                parentsIt->second.erase(group);
            }
        }
        if(parentsIt != _parents.end() && parentsIt->second.empty()) {
            _parents.erase(parentsIt);
        }
        refreshSubtree(id);
    }

    void ContainmentSnapshot::removed(const std::string &id) {
        if(auto it = _parents.find(id); it != _parents.end()) {
            for(const auto &parent : it->second) {
                auto &members = _members[parent];
                members.erase(std::remove(members.begin(), members.end(), id), members.end());
            }
            _parents.erase(it);
        }
        std::vector<std::string> orphans;
        if(auto it = _members.find(id); it != _members.end()) {
            orphans = it->second;
            _members.erase(it);
        }
        for(const auto &member : orphans) {
            if(auto it = _parents.find(member); it != _parents.end()) {
                it->second.erase(id);
                if(it->second.empty()) {
                    _parents.erase(it);
                }
            }
        }
        _closure.erase(id);
        _resources.erase(id);
        for(const auto &member : orphans) {
            refreshSubtree(member);
        }
    }

    bool ContainmentSnapshot::sameEdges(const std::string &left, const std::string &right) const {
        auto parentsOf = [this](const std::string &id) {
            auto it = _parents.find(id);
            return it == _parents.end() ? std::set<std::string>{} : it->second;
        };
        return parentsOf(left) == parentsOf(right) && isGroup(left) == isGroup(right)
               && membersOf(left) == membersOf(right);
    }

    void ContainmentSnapshot::renamed(const std::string &oldId, const std::string &newId) {
        // A walk that already read the catalog after the rename leaves the old id absent
        if(oldId == newId || _resources.find(oldId) == _resources.end()) {
            return;
        }
        if(_resources.find(newId) != _resources.end()) {
            if(sameEdges(oldId, newId)) {
                return;
            }
            throw errors::Error("ContainmentConflict", "Rename target already indexed: " + newId);
        }
        auto descendants = descendantsOf(oldId);
        auto rekey = [&oldId, &newId](auto &map) {
            if(auto node = map.extract(oldId); !node.empty()) {
                node.key() = newId;
                map.insert(std::move(node));
            }
        };
        _resources.erase(oldId);
        _resources.insert(newId);
        rekey(_members);
        rekey(_parents);
        rekey(_closure);
        if(auto it = _parents.find(newId); it != _parents.end()) {
            for(const auto &parent : it->second) {
                auto &members = _members[parent];
                std::replace(members.begin(), members.end(), oldId, newId);
            }
        }
        if(auto it = _members.find(newId); it != _members.end()) {
            for(const auto &member : it->second) {
                auto &parents = _parents[member];
                parents.erase(oldId);
                parents.insert(newId);
            }
        }
        // Memberships are unchanged, only the name inside the descendants' closures moves
        for(const auto &descendant : descendants) {
            auto &closure = _closure[descendant];
            if(closure.erase(oldId) > 0) {
                closure.insert(newId);
            }
        }
    }

    void ContainmentSnapshot::applyEvent(const catalog::CatalogEvent &event) {
        switch(event.type) {
            case catalog::CatalogEvent::Type::ADDED:
                added(event.id, event.parents, event.kind);
                break;
            case catalog::CatalogEvent::Type::DETACHED:
                detached(event.id, event.parents);
                break;
            case catalog::CatalogEvent::Type::REMOVED:
                removed(event.id);
                break;
            case catalog::CatalogEvent::Type::RENAMED:
                renamed(event.id, event.newId);
                break;
        }
    }

    std::set<std::string> ContainmentSnapshot::groupsContaining(const std::string &id) const {
        if(auto it = _closure.find(id); it != _closure.end()) {
            return it->second;
        }
        return {};
    }

    std::vector<std::string> ContainmentSnapshot::membersOf(const std::string &groupId) const {
        if(auto it = _members.find(groupId); it != _members.end()) {
            return it->second;
        }
        return {};
    }

    bool ContainmentSnapshot::isGroup(const std::string &id) const {
        return _members.find(id) != _members.end();
    }

    bool ContainmentSnapshot::contains(const std::string &id) const {
        return _resources.find(id) != _resources.end();
    }

    ContainmentIndex::ContainmentIndex() : _current(std::make_shared<ContainmentSnapshot>()) {
    }

    std::shared_ptr<ContainmentSnapshot> ContainmentIndex::walk(const catalog::Catalog &catalog) {
        auto view = catalog.view();
        auto next = std::make_shared<ContainmentSnapshot>();
        for(const auto &resource : view.resources) {
            next->_resources.insert(resource.id);
            if(resource.kind == catalog::ResourceKind::GROUP) {
                next->_members.try_emplace(resource.id);
            }
        }
        for(auto &[group, members] : view.members) {
            next->_resources.insert(group);
            for(const auto &member : members) {
                next->_resources.insert(member);
                next->_parents[member].insert(group);
            }
            next->_members[group] = std::move(members);
        }
        for(const auto &id : next->_resources) {
            next->refreshClosure(id);
        }
        return next;
    }

    void ContainmentIndex::publish(std::shared_ptr<const ContainmentSnapshot> next) {
        std::unique_lock guard{_mutex};
        _current = std::move(next);
    }

    void ContainmentIndex::build(const catalog::Catalog &catalog) {
        std::lock_guard writer{_writerMutex};
        std::shared_ptr<ContainmentSnapshot> next;
        try {
            next = walk(catalog);
        } catch(const errors::Error &e) {
            LOG.atError()
                .event("containment-build-failed")
                .cause(e)
                .logAndThrow(errors::ContainmentIndexUnavailable(
                    std::string("Cannot build containment index: ") + e.what()));
        }
        LOG.atInfo()
            .event("containment-built")
            .kv("resources", next->size())
            .kv("groups", next->_members.size())
            .log();
        publish(std::move(next));
        _degraded.store(false);
        _ready.store(true);
    }

    bool ContainmentIndex::rebuild(const catalog::Catalog &catalog) {
        std::lock_guard writer{_writerMutex};
        std::shared_ptr<ContainmentSnapshot> next;
        try {
            next = walk(catalog);
        } catch(const errors::Error &e) {
            _degraded.store(true);
            LOG.atWarn()
                .event("containment-degraded")
                .cause(e)
                .log("Refresh failed, serving last known good index");
            return false;
        }
        publish(std::move(next));
        _degraded.store(false);
        _ready.store(true);
        LOG.atDebug().event("containment-rebuilt").log();
        return true;
    }

    std::shared_ptr<const ContainmentSnapshot> ContainmentIndex::snapshot() const {
        std::shared_lock guard{_mutex};
        return _current;
    }

    void ContainmentIndex::resourceAdded(
        const std::string &id, const std::vector<std::string> &parents, catalog::ResourceKind kind) {
        apply({catalog::CatalogEvent::added(id, parents, kind)});
    }

    void ContainmentIndex::resourceDetached(
        const std::string &id, const std::vector<std::string> &groups) {
        apply({catalog::CatalogEvent::detached(id, groups)});
    }

    void ContainmentIndex::resourceRemoved(const std::string &id) {
        apply({catalog::CatalogEvent::removed(id)});
    }

    void ContainmentIndex::resourceRenamed(const std::string &oldId, const std::string &newId) {
        apply({catalog::CatalogEvent::renamed(oldId, newId)});
    }

    void ContainmentIndex::apply(const std::vector<catalog::CatalogEvent> &events) {
        if(events.empty()) {
            return;
        }
        std::lock_guard writer{_writerMutex};
        auto next = std::make_shared<ContainmentSnapshot>(*snapshot());
        for(const auto &event : events) {
            next->applyEvent(event);
        }
        publish(std::move(next));
    }

    void ContainmentIndex::onCatalogEvents(const std::vector<catalog::CatalogEvent> &events) {
        // The catalog has already committed these changes, so a rejection stays here
        try {
            apply(events);
        } catch(const errors::Error &e) {
            // The catalog and the index now disagree until the next successful rebuild
            _degraded.store(true);
            LOG.atError()
                .event(
                    dynamic_cast<const errors::ContainmentCycle *>(&e) != nullptr
                        ? "containment-cycle"
                        : "containment-rejected")
                .kv("events", events.size())
                .kv("kind", e.kind())
                .cause(e)
                .log("Rejected catalog change");
        }
    }

} // namespace containment
