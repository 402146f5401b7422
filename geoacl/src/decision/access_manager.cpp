#include "decision/access_manager.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include "rules/remote_rule_store.hpp"
#include <mutex>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.decision.AccessManager");

namespace decision {

    AccessManager::AccessManager(
        config::AccessManagerConfig config,
        std::shared_ptr<rules::LocalRuleStore> localRules,
        catalog::Catalog &catalog,
        std::shared_ptr<rules::HttpTransport> transport)
        : _catalog(catalog), _localRules(std::move(localRules)), _transport(std::move(transport)),
          _index(std::make_shared<containment::ContainmentIndex>()) {
        if(!_localRules) {
            _localRules = std::make_shared<rules::LocalRuleStore>();
        }
        config.validate();
        applyLogLevel(config);
        auto current = std::make_shared<const config::AccessManagerConfig>(std::move(config));
        _engine = std::make_shared<const DecisionEngine>(current, ruleStoreFor(*current), _index);
        // Subscribe first so nothing published during the walk is missed; replaying an event
        // the walk already saw leaves the index unchanged
        _catalog.addListener(*_index);
        try {
            _index->build(_catalog);
        } catch(const std::exception &) {
            _catalog.removeListener(*_index);
            throw;
        }
        LOG.atInfo()
            .event("access-manager-started")
            .kv("serviceUrl", current->serviceUrl)
            .kv("grantWriteToAuthenticatedUsers", current->grantWriteToAuthenticatedUsers)
            .log();
    }

    AccessManager::~AccessManager() {
        _catalog.removeListener(*_index);
    }

    std::shared_ptr<const rules::RuleStore> AccessManager::ruleStoreFor(
        const config::AccessManagerConfig &config) const {
        if(config.isInternal()) {
            return _localRules;
        }
        auto transport = _transport ? _transport : rules::CurlTransport::create();
        return std::make_shared<rules::RemoteRuleStore>(config.serviceUrl, config.timeout, transport);
    }

    void AccessManager::applyLogLevel(const config::AccessManagerConfig &config) {
        if(config.logLevel.has_value()) {
            logging::LogManager::get().setLevel(config.logLevel.value());
        }
    }

    std::shared_ptr<const DecisionEngine> AccessManager::engine() const {
        std::shared_lock guard{_mutex};
        return _engine;
    }

    Decision AccessManager::decide(
        const request::DecisionKey &key, const tasks::CancellationToken &cancel) const {
        return engine()->decide(key, cancel);
    }

    std::shared_ptr<const config::AccessManagerConfig> AccessManager::config() const {
        auto current = engine();
        // Aliasing constructor: the config lives as long as the engine that owns it
        return {current, &current->config()};
    }

    void AccessManager::testConfig(const config::AccessManagerConfig &candidate) const {
        candidate.validate();
        auto store = ruleStoreFor(candidate);
        request::DecisionKey probe{{}, {}, "", "", {}, {}};
        // Only reachability matters; whatever rules come back are discarded
        static_cast<void>(store->matchingRules(probe));
        LOG.atDebug().event("config-tested").kv("serviceUrl", candidate.serviceUrl).log();
    }

    void AccessManager::updateConfig(config::AccessManagerConfig next) {
        try {
            testConfig(next);
        } catch(const errors::Error &e) {
            LOG.atError()
                .event("config-rejected")
                .kv("serviceUrl", next.serviceUrl)
                .cause(e)
                .log("Keeping the current configuration");
            throw;
        }
        auto current = std::make_shared<const config::AccessManagerConfig>(std::move(next));
        auto replacement =
            std::make_shared<const DecisionEngine>(current, ruleStoreFor(*current), _index);
        applyLogLevel(*current);
        {
            std::unique_lock guard{_mutex};
            _engine = std::move(replacement);
        }
        LOG.atInfo()
            .event("config-updated")
            .kv("serviceUrl", current->serviceUrl)
            .kv("grantWriteToAuthenticatedUsers", current->grantWriteToAuthenticatedUsers)
            .log();
    }

    bool AccessManager::refreshIndex() {
        return _index->rebuild(_catalog);
    }

} // namespace decision
