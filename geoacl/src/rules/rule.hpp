#pragma once
#include "request/decision_key.hpp"
#include "rules/address_range.hpp"
#include "rules/name_pattern.hpp"
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace rules {

    // Ordered: READ < WRITE < ADMIN
    enum class AccessMode { READ = 0, WRITE = 1, ADMIN = 2 };

    enum class Grant { ALLOW, DENY };

    std::string_view accessModeName(AccessMode mode) noexcept;
    std::optional<AccessMode> parseAccessMode(std::string_view name);
    std::string_view grantName(Grant grant) noexcept;
    std::optional<Grant> parseGrant(std::string_view name);

    /**
     * One access rule. Patterns left at their default match anything. Service and operation
     * patterns are case-insensitive.
     */
    struct Rule {
        // Assigned by the store in insertion order; 0 until stored
        uint64_t id{0};
        int64_t priority{0};
        Grant grant{Grant::ALLOW};
        AccessMode access{AccessMode::READ};
        NamePattern workspace;
        NamePattern layer;
        NamePattern service;
        NamePattern operation;
        // Caller needs at least one of these; empty means any caller
        std::set<std::string> roles;
        std::optional<AddressRange> addressRange;

        static Rule allow(
            std::string_view workspace,
            std::string_view layer,
            AccessMode access,
            std::set<std::string> roles = {},
            int64_t priority = 0);
        static Rule deny(
            std::string_view workspace,
            std::string_view layer,
            AccessMode access,
            std::set<std::string> roles = {},
            int64_t priority = 0);

        /**
         * Pattern and address match against the key. Roles are checked separately.
         */
        [[nodiscard]] bool matches(const request::DecisionKey &key) const;

        [[nodiscard]] bool rolesSatisfiedBy(const std::set<std::string> &callerRoles) const;

        /**
         * An ALLOW for mode X covers every mode up to X; a DENY for mode X covers X and above.
         */
        [[nodiscard]] bool appliesTo(AccessMode requested) const noexcept;

        [[nodiscard]] int specificity() const noexcept;

        [[nodiscard]] std::string describe() const;
    };

    /**
     * Store order: priority descending, then specificity descending, then id ascending.
     */
    struct RuleOrder {
        bool operator()(const Rule &lhs, const Rule &rhs) const noexcept;
    };

} // namespace rules
