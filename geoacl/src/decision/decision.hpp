#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace decision {

    enum class DenyReason {
        NO_MATCHING_RULE,
        EXPLICIT_DENY,
        SERVICE_UNAVAILABLE,
        INDEX_UNAVAILABLE,
        CANCELLED,
        INTERNAL_ERROR
    };

    std::string_view denyReasonName(DenyReason reason) noexcept;

    /**
     * Outcome of one evaluation: Allow, Deny(reason) or AllowFiltered(members). The reason and
     * detail are for diagnostics only and are never shown to the caller.
     */
    class Decision {
    public:
        enum class Kind { ALLOW, DENY, ALLOW_FILTERED };

    private:
        Kind _kind{Kind::DENY};
        std::optional<DenyReason> _reason;
        std::vector<std::string> _allowedMembers;
        std::string _detail;

        Decision(
            Kind kind,
            std::optional<DenyReason> reason,
            std::vector<std::string> members,
            std::string detail)
            : _kind(kind), _reason(reason), _allowedMembers(std::move(members)),
              _detail(std::move(detail)) {
        }

    public:
        static Decision allow() {
            return {Kind::ALLOW, {}, {}, {}};
        }
        static Decision deny(DenyReason reason, std::string detail = {}) {
            return {Kind::DENY, reason, {}, std::move(detail)};
        }
        static Decision allowFiltered(std::vector<std::string> members) {
            return {Kind::ALLOW_FILTERED, {}, std::move(members), {}};
        }

        [[nodiscard]] Kind kind() const noexcept {
            return _kind;
        }
        [[nodiscard]] bool isAllowed() const noexcept {
            return _kind != Kind::DENY;
        }
        [[nodiscard]] bool isDenied() const noexcept {
            return _kind == Kind::DENY;
        }
        [[nodiscard]] std::optional<DenyReason> reason() const noexcept {
            return _reason;
        }
        [[nodiscard]] const std::vector<std::string> &allowedMembers() const noexcept {
            return _allowedMembers;
        }
        [[nodiscard]] const std::string &detail() const noexcept {
            return _detail;
        }

        // Detail text is not part of the outcome
        bool operator==(const Decision &other) const {
            return _kind == other._kind && _reason == other._reason
                   && _allowedMembers == other._allowedMembers;
        }
        bool operator!=(const Decision &other) const {
            return !(*this == other);
        }
    };

    std::ostream &operator<<(std::ostream &os, const Decision &decision);

} // namespace decision
