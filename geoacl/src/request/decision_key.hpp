#pragma once
#include <optional>
#include <ostream>
#include <set>
#include <string>

namespace request {

    /**
     * Canonical, immutable description of "who is asking to do what to which resource". Built
     * once per inbound operation by RequestContextBuilder and never modified afterwards; derived
     * keys (e.g. for the members of a group) are new values.
     *
     * Unset optional fields are distinct from empty strings.
     */
    class DecisionKey {
        std::optional<std::string> _user;
        std::set<std::string> _roles;
        std::string _service;
        std::string _operation;
        std::optional<std::string> _workspace;
        std::optional<std::string> _layer;
        std::optional<std::string> _subfield;
        std::optional<std::string> _sourceAddress;

    public:
        DecisionKey() = default;
        DecisionKey(
            std::optional<std::string> user,
            std::set<std::string> roles,
            std::string service,
            std::string operation,
            std::optional<std::string> workspace,
            std::optional<std::string> layer,
            std::optional<std::string> subfield = {},
            std::optional<std::string> sourceAddress = {});

        [[nodiscard]] const std::optional<std::string> &user() const noexcept {
            return _user;
        }
        [[nodiscard]] const std::set<std::string> &roles() const noexcept {
            return _roles;
        }
        [[nodiscard]] const std::string &service() const noexcept {
            return _service;
        }
        [[nodiscard]] const std::string &operation() const noexcept {
            return _operation;
        }
        [[nodiscard]] const std::optional<std::string> &workspace() const noexcept {
            return _workspace;
        }
        [[nodiscard]] const std::optional<std::string> &layer() const noexcept {
            return _layer;
        }
        [[nodiscard]] const std::optional<std::string> &subfield() const noexcept {
            return _subfield;
        }
        [[nodiscard]] const std::optional<std::string> &sourceAddress() const noexcept {
            return _sourceAddress;
        }

        [[nodiscard]] bool hasRole(const std::string &role) const {
            return _roles.find(role) != _roles.end();
        }

        [[nodiscard]] bool isAnonymous() const noexcept {
            return !_user.has_value();
        }

        /**
         * Identity of the targeted resource ("workspace:layer", or "layer" when no workspace is
         * set). Empty when the key does not target a layer.
         */
        [[nodiscard]] std::optional<std::string> resourceId() const;

        /**
         * Same caller and operation, different target resource. Used to evaluate the members of
         * a group as resources of their own.
         */
        [[nodiscard]] DecisionKey withResource(
            std::optional<std::string> workspace, std::optional<std::string> layer) const;

        bool operator==(const DecisionKey &other) const;
        bool operator!=(const DecisionKey &other) const {
            return !(*this == other);
        }
    };

    std::ostream &operator<<(std::ostream &os, const DecisionKey &key);

} // namespace request
