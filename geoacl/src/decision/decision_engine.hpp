#pragma once
#include "config/access_manager_config.hpp"
#include "containment/containment_index.hpp"
#include "decision/decision.hpp"
#include "decision/operation_classifier.hpp"
#include "request/decision_key.hpp"
#include "rules/rule_store.hpp"
#include "tasks/cancellation.hpp"
#include <memory>

namespace decision {

    /**
     * Combines the rule store, the containment index and the static policy into a decision.
     * Holds no per-call state: an instance is built for one configuration and shared by every
     * request thread until the configuration changes.
     */
    class DecisionEngine {
        std::shared_ptr<const config::AccessManagerConfig> _config;
        std::shared_ptr<const rules::RuleStore> _rules;
        std::shared_ptr<const containment::ContainmentIndex> _index;
        OperationClassifier _classifier;

        [[nodiscard]] bool isAuthenticated(const request::DecisionKey &key) const;
        [[nodiscard]] Decision evaluate(
            const request::DecisionKey &key,
            rules::AccessMode access,
            const tasks::CancellationToken &cancel) const;
        [[nodiscard]] Decision filterMembers(
            const request::DecisionKey &key,
            const std::vector<std::string> &members,
            const tasks::CancellationToken &cancel) const;
        [[nodiscard]] Decision decideUnchecked(
            const request::DecisionKey &key, const tasks::CancellationToken &cancel) const;

    public:
        static constexpr auto ANONYMOUS_ROLE = "ROLE_ANONYMOUS";

        DecisionEngine(
            std::shared_ptr<const config::AccessManagerConfig> config,
            std::shared_ptr<const rules::RuleStore> rules,
            std::shared_ptr<const containment::ContainmentIndex> index);

        /**
         * Never throws: every failure resolves to a Deny carrying the reason.
         */
        [[nodiscard]] Decision decide(
            const request::DecisionKey &key,
            const tasks::CancellationToken &cancel = tasks::CancellationToken{}) const;

        [[nodiscard]] const config::AccessManagerConfig &config() const noexcept {
            return *_config;
        }
        [[nodiscard]] const rules::RuleStore &ruleStore() const noexcept {
            return *_rules;
        }
    };

} // namespace decision
