#include "decision/decision_engine.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include "request/resource_id.hpp"
#include <sstream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.decision.DecisionEngine");

namespace decision {

    namespace {
        std::string describeKey(const request::DecisionKey &key) {
            std::ostringstream os;
            os << key;
            return os.str();
        }
    } // namespace

    DecisionEngine::DecisionEngine(
        std::shared_ptr<const config::AccessManagerConfig> config,
        std::shared_ptr<const rules::RuleStore> rules,
        std::shared_ptr<const containment::ContainmentIndex> index)
        : _config(std::move(config)), _rules(std::move(rules)), _index(std::move(index)) {
        if(!_config || !_rules || !_index) {
            throw errors::ConfigError("Decision engine needs a configuration, rule store and index");
        }
        _classifier = OperationClassifier(_config->operations);
    }

    bool DecisionEngine::isAuthenticated(const request::DecisionKey &key) const {
        if(key.isAnonymous()) {
            return false;
        }
        for(const auto &role : key.roles()) {
            if(role != ANONYMOUS_ROLE) {
                return true;
            }
        }
        return false;
    }

    Decision DecisionEngine::evaluate(
        const request::DecisionKey &key,
        rules::AccessMode access,
        const tasks::CancellationToken &cancel) const {
        if(cancel.isCancelled()) {
            return Decision::deny(DenyReason::CANCELLED);
        }
        std::vector<rules::Rule> matching;
        try {
            matching = _rules->matchingRules(key, cancel);
        } catch(const errors::ServiceUnavailable &e) {
            LOG.atError()
                .event("rule-store-unavailable")
                .kv("url", _rules->describe())
                .kv("failure", errors::ServiceUnavailable::failureName(e.failure()))
                .cause(e)
                .log("Authorization service unavailable, denying");
            return Decision::deny(DenyReason::SERVICE_UNAVAILABLE, e.what());
        } catch(const errors::Cancelled &e) {
            return Decision::deny(DenyReason::CANCELLED, e.what());
        }

        const rules::Rule *deciding = nullptr;
        for(const auto &rule : matching) {
            if(rule.rolesSatisfiedBy(key.roles()) && rule.appliesTo(access)) {
                deciding = &rule;
                break;
            }
        }
        bool explicitDeny = deciding != nullptr && deciding->grant == rules::Grant::DENY;

        if(access == rules::AccessMode::WRITE && _config->grantWriteToAuthenticatedUsers
           && !explicitDeny && isAuthenticated(key)) {
            return Decision::allow();
        }
        if(deciding == nullptr) {
            return Decision::deny(DenyReason::NO_MATCHING_RULE);
        }
        if(explicitDeny) {
            return Decision::deny(DenyReason::EXPLICIT_DENY, deciding->describe());
        }
        return Decision::allow();
    }

    Decision DecisionEngine::filterMembers(
        const request::DecisionKey &key,
        const std::vector<std::string> &members,
        const tasks::CancellationToken &cancel) const {
        std::vector<std::string> allowed;
        for(const auto &member : members) {
            auto id = request::ResourceId::parse(member);
            auto memberDecision =
                evaluate(key.withResource(id.workspace, id.name), rules::AccessMode::READ, cancel);
            if(memberDecision.isAllowed()) {
                allowed.push_back(member);
                continue;
            }
            auto reason = memberDecision.reason();
            if(reason == DenyReason::SERVICE_UNAVAILABLE || reason == DenyReason::CANCELLED) {
                return memberDecision;
            }
        }
        return Decision::allowFiltered(std::move(allowed));
    }

    Decision DecisionEngine::decideUnchecked(
        const request::DecisionKey &key, const tasks::CancellationToken &cancel) const {
        if(key.hasRole(_config->adminRole)) {
            return Decision::allow();
        }
        auto classification = _classifier.classify(key.service(), key.operation());
        auto decision = evaluate(key, classification.access, cancel);
        if(decision.isDenied() || !classification.listing) {
            return decision;
        }
        auto target = key.resourceId();
        if(!target.has_value()) {
            return decision;
        }
        if(!_index->ready()) {
            return Decision::deny(DenyReason::INDEX_UNAVAILABLE, "Containment index not built");
        }
        // One snapshot for the whole listing so membership cannot change halfway through
        auto snapshot = _index->snapshot();
        if(!snapshot->isGroup(target.value())) {
            return decision;
        }
        if(_index->degraded()) {
            LOG.atWarn()
                .event("containment-degraded")
                .kv("group", target.value())
                .log("Listing group from last known good index");
        }
        return filterMembers(key, snapshot->membersOf(target.value()), cancel);
    }

    Decision DecisionEngine::decide(
        const request::DecisionKey &key, const tasks::CancellationToken &cancel) const {
        Decision decision = Decision::deny(DenyReason::INTERNAL_ERROR);
        try {
            decision = decideUnchecked(key, cancel);
        } catch(const std::exception &e) {
            LOG.atError().event("decision-failed").kv("key", describeKey(key)).cause(e).log();
            decision = Decision::deny(DenyReason::INTERNAL_ERROR, e.what());
        }
        if(decision.isDenied() && logging::LogManager::get().isEnabled(logging::Level::Debug)) {
            LOG.atDebug()
                .event("access-denied")
                .kv("key", describeKey(key))
                .kv("reason", denyReasonName(decision.reason().value()))
                .kv("detail", decision.detail())
                .log();
        }
        return decision;
    }

} // namespace decision
