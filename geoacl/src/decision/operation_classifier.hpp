#pragma once
#include "config/access_manager_config.hpp"
#include "rules/rule.hpp"
#include <string_view>
#include <vector>

namespace decision {

    struct Classification {
        rules::AccessMode access{rules::AccessMode::READ};
        // Lists the members of a group target rather than acting on the group alone
        bool listing{false};
    };

    /**
     * Maps an upper-case (service, operation) pair to the access mode it requires. Configured
     * mappings win over the built-in table; an exact operation wins over "*".
     */
    class OperationClassifier {
        std::vector<config::OperationMapping> _overrides;

        static Classification builtin(std::string_view service, std::string_view operation);

    public:
        OperationClassifier() = default;
        explicit OperationClassifier(std::vector<config::OperationMapping> overrides)
            : _overrides(std::move(overrides)) {
        }

        [[nodiscard]] Classification classify(std::string_view service, std::string_view operation) const;
    };

} // namespace decision
