#include "rules/rule.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace rules {

    namespace {
        std::string upper(std::string_view name) {
            std::string out{name};
            std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return out;
        }

        Rule makeRule(
            Grant grant,
            std::string_view workspace,
            std::string_view layer,
            AccessMode access,
            std::set<std::string> roles,
            int64_t priority) {
            Rule rule;
            rule.grant = grant;
            rule.access = access;
            rule.workspace = NamePattern::compile(workspace);
            rule.layer = NamePattern::compile(layer);
            rule.roles = std::move(roles);
            rule.priority = priority;
            return rule;
        }
    } // namespace

    std::string_view accessModeName(AccessMode mode) noexcept {
        switch(mode) {
            case AccessMode::READ:
                return "READ";
            case AccessMode::WRITE:
                return "WRITE";
            case AccessMode::ADMIN:
                return "ADMIN";
        }
        return "UNKNOWN";
    }

    std::optional<AccessMode> parseAccessMode(std::string_view name) {
        auto mode = upper(name);
        if(mode == "READ") {
            return AccessMode::READ;
        }
        if(mode == "WRITE") {
            return AccessMode::WRITE;
        }
        if(mode == "ADMIN") {
            return AccessMode::ADMIN;
        }
        return {};
    }

    std::string_view grantName(Grant grant) noexcept {
        return grant == Grant::ALLOW ? "ALLOW" : "DENY";
    }

    std::optional<Grant> parseGrant(std::string_view name) {
        auto grant = upper(name);
        if(grant == "ALLOW") {
            return Grant::ALLOW;
        }
        if(grant == "DENY") {
            return Grant::DENY;
        }
        return {};
    }

    Rule Rule::allow(
        std::string_view workspace,
        std::string_view layer,
        AccessMode access,
        std::set<std::string> roles,
        int64_t priority) {
        return makeRule(Grant::ALLOW, workspace, layer, access, std::move(roles), priority);
    }

    Rule Rule::deny(
        std::string_view workspace,
        std::string_view layer,
        AccessMode access,
        std::set<std::string> roles,
        int64_t priority) {
        return makeRule(Grant::DENY, workspace, layer, access, std::move(roles), priority);
    }

    bool Rule::matches(const request::DecisionKey &key) const {
        if(!workspace.matches(key.workspace()) || !layer.matches(key.layer())) {
            return false;
        }
        if(!service.matches(std::string_view(key.service()))
           || !operation.matches(std::string_view(key.operation()))) {
            return false;
        }
        return !addressRange.has_value() || addressRange->contains(key.sourceAddress());
    }

    bool Rule::rolesSatisfiedBy(const std::set<std::string> &callerRoles) const {
        if(roles.empty()) {
            return true;
        }
        return std::any_of(roles.begin(), roles.end(), [&callerRoles](const std::string &role) {
            return callerRoles.find(role) != callerRoles.end();
        });
    }

    bool Rule::appliesTo(AccessMode requested) const noexcept {
        if(grant == Grant::ALLOW) {
            return requested <= access;
        }
        return requested >= access;
    }

    int Rule::specificity() const noexcept {
        int score = workspace.specificity() + layer.specificity() + service.specificity()
                    + operation.specificity();
        if(!roles.empty()) {
            score++;
        }
        if(addressRange.has_value()) {
            score++;
        }
        return score;
    }

    std::string Rule::describe() const {
        std::stringstream ss;
        ss << "#" << id << " " << grantName(grant) << " " << accessModeName(access) << " "
           << workspace.source() << ":" << layer.source() << " service=" << service.source()
           << " request=" << operation.source() << " priority=" << priority;
        return ss.str();
    }

    bool RuleOrder::operator()(const Rule &lhs, const Rule &rhs) const noexcept {
        if(lhs.priority != rhs.priority) {
            return lhs.priority > rhs.priority;
        }
        auto lhsSpecificity = lhs.specificity();
        auto rhsSpecificity = rhs.specificity();
        if(lhsSpecificity != rhsSpecificity) {
            return lhsSpecificity > rhsSpecificity;
        }
        return lhs.id < rhs.id;
    }

} // namespace rules
