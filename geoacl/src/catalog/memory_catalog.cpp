#include "catalog/memory_catalog.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.catalog.MemoryCatalog");

namespace catalog {

    void MemoryCatalog::checkAvailable() const {
        if(!_available.load()) {
            throw errors::CatalogUnavailable("Catalog is not available");
        }
    }

    bool MemoryCatalog::existsLocked(const std::string &id) const {
        return std::any_of(_resources.begin(), _resources.end(), [&id](const ResourceInfo &r) {
            return r.id == id;
        });
    }

    bool MemoryCatalog::isGroupLocked(const std::string &id) const {
        return _members.find(id) != _members.end();
    }

    bool MemoryCatalog::containsLocked(const std::string &groupId, const std::string &id) const {
        std::vector<std::string> pending{groupId};
        std::unordered_set<std::string> seen;
        while(!pending.empty()) {
            auto current = pending.back();
            pending.pop_back();
            if(!seen.insert(current).second) {
                continue;
            }
            auto it = _members.find(current);
            if(it == _members.end()) {
                continue;
            }
            for(const auto &member : it->second) {
                if(member == id) {
                    return true;
                }
                pending.push_back(member);
            }
        }
        return false;
    }

    std::vector<ResourceInfo> MemoryCatalog::resources() const {
        checkAvailable();
        std::shared_lock guard{_mutex};
        return _resources;
    }

    std::optional<ResourceInfo> MemoryCatalog::find(const std::string &id) const {
        checkAvailable();
        std::shared_lock guard{_mutex};
        for(const auto &resource : _resources) {
            if(resource.id == id) {
                return resource;
            }
        }
        return {};
    }

    std::vector<std::string> MemoryCatalog::membersOf(const std::string &groupId) const {
        checkAvailable();
        std::shared_lock guard{_mutex};
        if(auto it = _members.find(groupId); it != _members.end()) {
            return it->second;
        }
        return {};
    }

    CatalogView MemoryCatalog::view() const {
        checkAvailable();
        std::shared_lock guard{_mutex};
        return CatalogView{_resources, _members};
    }

    void MemoryCatalog::add(
        const std::string &id, ResourceKind kind, const std::vector<std::string> &parents) {
        std::lock_guard writer{_writerMutex};
        {
            std::unique_lock guard{_mutex};
            if(id.empty() || existsLocked(id)) {
                throw std::invalid_argument("Resource id is empty or already used: " + id);
            }
            for(const auto &parent : parents) {
                if(!isGroupLocked(parent)) {
                    throw std::invalid_argument("Parent is not a known group: " + parent);
                }
            }
            _resources.push_back(ResourceInfo{id, kind});
            if(kind == ResourceKind::GROUP) {
                _members.emplace(id, std::vector<std::string>{});
            }
            for(const auto &parent : parents) {
                auto &members = _members[parent];
                if(std::find(members.begin(), members.end(), id) == members.end()) {
                    members.push_back(id);
                }
            }
        }
        publish(CatalogEvent::added(id, parents, kind));
    }

    void MemoryCatalog::attach(const std::string &id, const std::string &groupId) {
        std::lock_guard writer{_writerMutex};
        ResourceKind kind{ResourceKind::LAYER};
        {
            std::unique_lock guard{_mutex};
            if(!existsLocked(id) || !isGroupLocked(groupId)) {
                throw std::invalid_argument("Unknown resource or group: " + id + " -> " + groupId);
            }
            if(id == groupId || containsLocked(id, groupId)) {
                throw std::invalid_argument("Group cannot contain itself: " + groupId);
            }
            auto &members = _members[groupId];
            if(std::find(members.begin(), members.end(), id) != members.end()) {
                return;
            }
            members.push_back(id);
            if(isGroupLocked(id)) {
                kind = ResourceKind::GROUP;
            }
        }
        publish(CatalogEvent::added(id, {groupId}, kind));
    }

    void MemoryCatalog::detach(const std::string &id, const std::string &groupId) {
        std::lock_guard writer{_writerMutex};
        {
            std::unique_lock guard{_mutex};
            auto it = _members.find(groupId);
            if(it == _members.end()) {
                throw std::invalid_argument("Unknown group: " + groupId);
            }
            auto &members = it->second;
            auto pos = std::find(members.begin(), members.end(), id);
            if(pos == members.end()) {
                return;
            }
            members.erase(pos);
        }
        publish(CatalogEvent::detached(id, {groupId}));
    }

    void MemoryCatalog::remove(const std::string &id) {
        std::lock_guard writer{_writerMutex};
        {
            std::unique_lock guard{_mutex};
            auto it = std::find_if(_resources.begin(), _resources.end(), [&id](const ResourceInfo &r) {
                return r.id == id;
            });
            if(it == _resources.end()) {
                throw std::invalid_argument("Unknown resource: " + id);
            }
            _resources.erase(it);
            _members.erase(id);
            for(auto &[group, members] : _members) {
                members.erase(std::remove(members.begin(), members.end(), id), members.end());
            }
        }
        publish(CatalogEvent::removed(id));
    }

    void MemoryCatalog::rename(const std::string &oldId, const std::string &newId) {
        std::lock_guard writer{_writerMutex};
        {
            std::unique_lock guard{_mutex};
            if(newId.empty() || existsLocked(newId)) {
                throw std::invalid_argument("Resource id is empty or already used: " + newId);
            }
            auto it = std::find_if(_resources.begin(), _resources.end(), [&oldId](const ResourceInfo &r) {
                return r.id == oldId;
            });
            if(it == _resources.end()) {
                throw std::invalid_argument("Unknown resource: " + oldId);
            }
            it->id = newId;
            if(auto node = _members.extract(oldId); !node.empty()) {
                node.key() = newId;
                _members.insert(std::move(node));
            }
            for(auto &[group, members] : _members) {
                std::replace(members.begin(), members.end(), oldId, newId);
            }
        }
        publish(CatalogEvent::renamed(oldId, newId));
    }

    void MemoryCatalog::batch(const std::function<void(MemoryCatalog &)> &mutations) {
        std::lock_guard writer{_writerMutex};
        _batchDepth++;
        try {
            mutations(*this);
        } catch(const std::exception &e) {
            // Whatever was applied before the failure is still published
            LOG.atWarn().event("catalog-batch-failed").cause(e).log("Publishing partial batch");
            _batchDepth--;
            flushPending();
            throw;
        }
        _batchDepth--;
        flushPending();
    }

    void MemoryCatalog::flushPending() {
        if(_batchDepth > 0 || _pending.empty()) {
            return;
        }
        std::vector<CatalogEvent> events;
        events.swap(_pending);
        notify(events);
    }

    void MemoryCatalog::notify(const std::vector<CatalogEvent> &events) {
        std::vector<CatalogListener *> listeners;
        {
            std::shared_lock guard{_mutex};
            listeners = _listeners;
        }
        for(auto *listener : listeners) {
            listener->onCatalogEvents(events);
        }
    }

    void MemoryCatalog::publish(CatalogEvent event) {
        if(_batchDepth > 0) {
            _pending.push_back(std::move(event));
            return;
        }
        notify({std::move(event)});
    }

    void MemoryCatalog::addListener(CatalogListener &listener) {
        std::unique_lock guard{_mutex};
        _listeners.push_back(&listener);
    }

    void MemoryCatalog::removeListener(CatalogListener &listener) {
        std::unique_lock guard{_mutex};
        _listeners.erase(
            std::remove(_listeners.begin(), _listeners.end(), &listener), _listeners.end());
    }

} // namespace catalog
