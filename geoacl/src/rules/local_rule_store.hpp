#pragma once
#include "rules/rule_store.hpp"
#include <cstdint>
#include <optional>
#include <shared_mutex>

namespace rules {

    /**
     * In-process rule table. Rules are kept in store order so a query is a single scan. The
     * mutating calls belong to the administrative surface; a query always sees the table either
     * before or after a mutation.
     */
    class LocalRuleStore : public RuleStore {
        mutable std::shared_mutex _mutex;
        std::vector<Rule> _rules;
        uint64_t _nextId{1};

        void insertSorted(Rule rule);

    public:
        LocalRuleStore() = default;
        explicit LocalRuleStore(std::vector<Rule> rules);

        [[nodiscard]] std::vector<Rule> matchingRules(
            const request::DecisionKey &key, const tasks::CancellationToken &cancel) const override;
        using RuleStore::matchingRules;

        [[nodiscard]] std::string describe() const override {
            return "internal";
        }

        /**
         * Stores the rule and returns the id assigned to it.
         */
        uint64_t add(Rule rule);
        bool remove(uint64_t id);

        /**
         * Replaces the whole table; ids are reassigned in the given order.
         */
        void replaceAll(std::vector<Rule> rules);

        [[nodiscard]] std::vector<Rule> rules() const;
        [[nodiscard]] std::optional<Rule> find(uint64_t id) const;
        [[nodiscard]] size_t size() const;
    };

} // namespace rules
