#include "rules/remote_rule_store.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include "rules/rule_codec.hpp"
#include <algorithm>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.rules.RemoteRuleStore");

namespace rules {

    RemoteRuleStore::RemoteRuleStore(
        std::string serviceUrl,
        std::chrono::milliseconds timeout,
        std::shared_ptr<HttpTransport> transport)
        : _serviceUrl(std::move(serviceUrl)), _timeout(timeout), _transport(std::move(transport)) {
        if(!_transport) {
            throw errors::ConfigError("Remote rule store requires a transport");
        }
        if(_timeout <= std::chrono::milliseconds::zero()) {
            throw errors::ConfigError("Remote rule store timeout must be positive");
        }
        std::string base = _serviceUrl;
        while(!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        _queryUrl = base + QUERY_PATH;
    }

    std::vector<Rule> RemoteRuleStore::matchingRules(
        const request::DecisionKey &key, const tasks::CancellationToken &cancel) const {
        if(cancel.isCancelled()) {
            throw errors::Cancelled();
        }
        auto response = _transport->postJson(_queryUrl, RuleCodec::encodeQuery(key), _timeout, cancel);
        if(response.status < 200 || response.status >= 300) {
            throw errors::ServiceUnavailable(
                errors::ServiceUnavailable::Failure::BAD_STATUS,
                "Authorization service answered with status " + std::to_string(response.status));
        }
        std::vector<Rule> rules;
        try {
            rules = RuleCodec::decodeRules(response.body);
        } catch(const errors::RuleError &e) {
            LOG.atError()
                .event("remote-rules-malformed")
                .kv("url", _queryUrl)
                .cause(e)
                .log("Discarding malformed authorization response");
            throw errors::ServiceUnavailable(
                errors::ServiceUnavailable::Failure::BAD_RESPONSE,
                std::string("Malformed authorization response: ") + e.what());
        }
        // The backend's order is normalised so both realisations break ties the same way
        std::stable_sort(rules.begin(), rules.end(), RuleOrder{});
        return rules;
    }

} // namespace rules
