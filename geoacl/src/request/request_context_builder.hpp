#pragma once
#include "request/decision_key.hpp"
#include <optional>
#include <set>
#include <string>

namespace request {

    /**
     * Authenticated caller as produced by the identity subsystem.
     */
    struct Principal {
        std::string name;
        std::set<std::string> roles;
    };

    /**
     * Raw description of an inbound operation as seen by the dispatch layer. Every field may be
     * missing.
     */
    struct OperationInfo {
        std::optional<std::string> service;
        std::optional<std::string> operation;
        std::optional<std::string> workspace;
        std::optional<std::string> layer;
        std::optional<std::string> subfield;
        std::optional<std::string> sourceAddress;
    };

    /**
     * Normalizes (principal, raw operation) into a DecisionKey:
     * - no principal: anonymous, user unset and no roles
     * - service and operation are upper-cased; a missing one becomes the empty string
     * - a prefixed layer ("topp:states") supplies the workspace when none is given
     * - missing optional fields stay unset
     */
    class RequestContextBuilder {
    public:
        [[nodiscard]] static DecisionKey build(
            const std::optional<Principal> &principal, const OperationInfo &operation);

    private:
        static std::string canonicalName(const std::optional<std::string> &value, const char *field);
        static void splitQualifiedLayer(
            std::optional<std::string> &workspace, std::optional<std::string> &layer);
    };

} // namespace request
