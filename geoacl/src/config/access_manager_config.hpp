#pragma once
#include "logging/log_manager.hpp"
#include "rules/rule.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace config {

    /**
     * Explicit classification of an operation, taking precedence over the built-in table.
     * Service and operation are upper-case; operation "*" covers every operation of the
     * service.
     */
    struct OperationMapping {
        std::string service;
        std::string operation;
        rules::AccessMode access{rules::AccessMode::READ};
        bool listing{false};
    };

    /**
     * Static policy of the access manager. Instances are immutable once handed to
     * AccessManager; an update builds a new one.
     */
    struct AccessManagerConfig {
        static constexpr auto INTERNAL = "internal";
        static constexpr auto DEFAULT_ADMIN_ROLE = "ROLE_ADMINISTRATOR";
        static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{5000};

        // "internal" selects the in-process rule table, anything else is a backend URL
        std::string serviceUrl{INTERNAL};
        bool grantWriteToAuthenticatedUsers{false};
        std::string adminRole{DEFAULT_ADMIN_ROLE};
        std::chrono::milliseconds timeout{DEFAULT_TIMEOUT};
        std::optional<logging::Level> logLevel;
        std::vector<OperationMapping> operations;

        [[nodiscard]] bool isInternal() const;

        /**
         * Raises errors::ConfigError when the combination of values cannot be used.
         */
        void validate() const;
    };

} // namespace config
