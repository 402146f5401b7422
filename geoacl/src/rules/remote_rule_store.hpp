#pragma once
#include "rules/http_transport.hpp"
#include "rules/rule_store.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace rules {

    /**
     * Rule store backed by a remote authorization service. Every query is one POST to
     * "<serviceUrl>/rules/query" bounded by the configured timeout. Transport failures, timeouts,
     * non-2xx statuses and unparseable bodies all surface as errors::ServiceUnavailable.
     */
    class RemoteRuleStore : public RuleStore {
        std::string _serviceUrl;
        std::string _queryUrl;
        std::chrono::milliseconds _timeout;
        std::shared_ptr<HttpTransport> _transport;

    public:
        static constexpr auto QUERY_PATH = "/rules/query";

        RemoteRuleStore(
            std::string serviceUrl,
            std::chrono::milliseconds timeout,
            std::shared_ptr<HttpTransport> transport);

        [[nodiscard]] std::vector<Rule> matchingRules(
            const request::DecisionKey &key, const tasks::CancellationToken &cancel) const override;
        using RuleStore::matchingRules;

        [[nodiscard]] std::string describe() const override {
            return _serviceUrl;
        }

        [[nodiscard]] std::chrono::milliseconds timeout() const noexcept {
            return _timeout;
        }
    };

} // namespace rules
