#pragma once
#include "catalog/catalog.hpp"
#include "config/access_manager_config.hpp"
#include "containment/containment_index.hpp"
#include "decision/decision_engine.hpp"
#include "rules/http_transport.hpp"
#include "rules/local_rule_store.hpp"
#include <memory>
#include <shared_mutex>

namespace decision {

    /**
     * Process-wide entry point of the policy engine. Owns the containment index (kept current
     * from the catalog's events) and the decision engine for the current configuration.
     *
     * A configuration change builds a new engine and replaces the old one in a single pointer
     * swap: a decision in flight keeps the engine it started with, the next one sees the new
     * configuration together with the rule store it selects.
     */
    class AccessManager {
        mutable std::shared_mutex _mutex;
        catalog::Catalog &_catalog;
        std::shared_ptr<rules::LocalRuleStore> _localRules;
        std::shared_ptr<rules::HttpTransport> _transport;
        std::shared_ptr<containment::ContainmentIndex> _index;
        std::shared_ptr<const DecisionEngine> _engine;

        [[nodiscard]] std::shared_ptr<const rules::RuleStore> ruleStoreFor(
            const config::AccessManagerConfig &config) const;
        static void applyLogLevel(const config::AccessManagerConfig &config);

    public:
        /**
         * Builds the containment index from the catalog and subscribes to its events. Raises
         * errors::ContainmentIndexUnavailable when the catalog cannot be walked and
         * errors::ConfigError when the configuration is unusable. A null transport means libcurl
         * is used for a remote rule store.
         */
        AccessManager(
            config::AccessManagerConfig config,
            std::shared_ptr<rules::LocalRuleStore> localRules,
            catalog::Catalog &catalog,
            std::shared_ptr<rules::HttpTransport> transport = nullptr);
        AccessManager(const AccessManager &) = delete;
        AccessManager(AccessManager &&) = delete;
        AccessManager &operator=(const AccessManager &) = delete;
        AccessManager &operator=(AccessManager &&) = delete;
        ~AccessManager();

        [[nodiscard]] Decision decide(
            const request::DecisionKey &key,
            const tasks::CancellationToken &cancel = tasks::CancellationToken{}) const;

        [[nodiscard]] std::shared_ptr<const config::AccessManagerConfig> config() const;

        /**
         * The engine serving the current configuration. Its config() and ruleStore() always
         * belong to the same update.
         */
        [[nodiscard]] std::shared_ptr<const DecisionEngine> engine() const;

        /**
         * Checks that a configuration can be served: it must validate, and the rule store it
         * selects must answer a probe query. Raises errors::ConfigError or
         * errors::ServiceUnavailable.
         */
        void testConfig(const config::AccessManagerConfig &candidate) const;

        /**
         * testConfig, then install. On failure the current configuration stays in place.
         */
        void updateConfig(config::AccessManagerConfig next);

        /**
         * Re-walks the catalog. Returns false, and leaves the index degraded, when it cannot.
         */
        bool refreshIndex();

        [[nodiscard]] const containment::ContainmentIndex &index() const noexcept {
            return *_index;
        }
        [[nodiscard]] rules::LocalRuleStore &localRules() noexcept {
            return *_localRules;
        }
    };

} // namespace decision
