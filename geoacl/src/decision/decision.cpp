#include "decision/decision.hpp"

namespace decision {

    std::string_view denyReasonName(DenyReason reason) noexcept {
        switch(reason) {
            case DenyReason::NO_MATCHING_RULE:
                return "NO_MATCHING_RULE";
            case DenyReason::EXPLICIT_DENY:
                return "EXPLICIT_DENY";
            case DenyReason::SERVICE_UNAVAILABLE:
                return "SERVICE_UNAVAILABLE";
            case DenyReason::INDEX_UNAVAILABLE:
                return "INDEX_UNAVAILABLE";
            case DenyReason::CANCELLED:
                return "CANCELLED";
            case DenyReason::INTERNAL_ERROR:
                return "INTERNAL_ERROR";
        }
        return "UNKNOWN";
    }

    std::ostream &operator<<(std::ostream &os, const Decision &decision) {
        switch(decision.kind()) {
            case Decision::Kind::ALLOW:
                return os << "ALLOW";
            case Decision::Kind::DENY:
                os << "DENY";
                if(decision.reason().has_value()) {
                    os << '(' << denyReasonName(decision.reason().value()) << ')';
                }
                return os;
            case Decision::Kind::ALLOW_FILTERED:
                os << "ALLOW_FILTERED";
                for(const auto &member : decision.allowedMembers()) {
                    os << ' ' << member;
                }
                return os;
        }
        return os;
    }

} // namespace decision
