#include "rules/local_rule_store.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <mutex>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.rules.LocalRuleStore");

namespace rules {

    LocalRuleStore::LocalRuleStore(std::vector<Rule> rules) {
        replaceAll(std::move(rules));
    }

    void LocalRuleStore::insertSorted(Rule rule) {
        rule.id = _nextId++;
        auto pos = std::upper_bound(_rules.begin(), _rules.end(), rule, RuleOrder{});
        _rules.insert(pos, std::move(rule));
    }

    std::vector<Rule> LocalRuleStore::matchingRules(
        const request::DecisionKey &key, const tasks::CancellationToken &cancel) const {
        if(cancel.isCancelled()) {
            throw errors::Cancelled();
        }
        std::vector<Rule> out;
        std::shared_lock guard{_mutex};
        for(const auto &rule : _rules) {
            if(rule.matches(key) && rule.rolesSatisfiedBy(key.roles())) {
                out.push_back(rule);
            }
        }
        return out;
    }

    uint64_t LocalRuleStore::add(Rule rule) {
        std::unique_lock guard{_mutex};
        auto id = _nextId;
        insertSorted(std::move(rule));
        LOG.atDebug().event("rule-added").kv("id", id).log();
        return id;
    }

    bool LocalRuleStore::remove(uint64_t id) {
        std::unique_lock guard{_mutex};
        auto it = std::find_if(_rules.begin(), _rules.end(), [id](const Rule &rule) {
            return rule.id == id;
        });
        if(it == _rules.end()) {
            return false;
        }
        _rules.erase(it);
        LOG.atDebug().event("rule-removed").kv("id", id).log();
        return true;
    }

    void LocalRuleStore::replaceAll(std::vector<Rule> rules) {
        std::unique_lock guard{_mutex};
        _rules.clear();
        _rules.reserve(rules.size());
        _nextId = 1;
        for(auto &rule : rules) {
            insertSorted(std::move(rule));
        }
        LOG.atInfo().event("rules-loaded").kv("count", _rules.size()).log();
    }

    std::vector<Rule> LocalRuleStore::rules() const {
        std::shared_lock guard{_mutex};
        return _rules;
    }

    std::optional<Rule> LocalRuleStore::find(uint64_t id) const {
        std::shared_lock guard{_mutex};
        for(const auto &rule : _rules) {
            if(rule.id == id) {
                return rule;
            }
        }
        return {};
    }

    size_t LocalRuleStore::size() const {
        std::shared_lock guard{_mutex};
        return _rules.size();
    }

} // namespace rules
