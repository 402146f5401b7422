#pragma once
#include "request/decision_key.hpp"
#include "rules/rule.hpp"
#include "tasks/cancellation.hpp"
#include <string>
#include <vector>

namespace rules {

    /**
     * Authorization oracle: returns every rule matching a key, most specific first (see
     * RuleOrder). Realised in-process (LocalRuleStore) or against a remote backend
     * (RemoteRuleStore).
     *
     * A backend that cannot answer raises errors::ServiceUnavailable; an empty result always
     * means "no rule matched". A cancelled token raises errors::Cancelled.
     */
    class RuleStore {
    public:
        RuleStore() = default;
        RuleStore(const RuleStore &) = delete;
        RuleStore(RuleStore &&) = delete;
        RuleStore &operator=(const RuleStore &) = delete;
        RuleStore &operator=(RuleStore &&) = delete;
        virtual ~RuleStore() = default;

        [[nodiscard]] virtual std::vector<Rule> matchingRules(
            const request::DecisionKey &key, const tasks::CancellationToken &cancel) const = 0;

        [[nodiscard]] std::vector<Rule> matchingRules(const request::DecisionKey &key) const {
            return matchingRules(key, tasks::CancellationToken{});
        }

        [[nodiscard]] virtual std::string describe() const = 0;
    };

} // namespace rules
