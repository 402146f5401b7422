#pragma once
#include "decision/access_manager.hpp"
#include "decision/decision.hpp"
#include "request/request_context_builder.hpp"
#include "tasks/cancellation.hpp"
#include <optional>
#include <string>
#include <vector>

namespace interception {

    /**
     * One inbound operation as seen by the dispatch layer. Belongs to a single request flow and
     * remembers the decision taken for it, so a retried dispatch does not evaluate twice.
     */
    class Operation {
        std::optional<request::Principal> _principal;
        request::OperationInfo _info;
        tasks::CancellationToken _cancel;
        std::optional<std::vector<std::string>> _members;
        std::optional<decision::Decision> _decision;

        friend class AccessInterceptor;

    public:
        Operation(
            std::optional<request::Principal> principal,
            request::OperationInfo info,
            tasks::CancellationToken cancel = tasks::CancellationToken{})
            : _principal(std::move(principal)), _info(std::move(info)), _cancel(std::move(cancel)) {
        }

        [[nodiscard]] const std::optional<request::Principal> &principal() const noexcept {
            return _principal;
        }
        [[nodiscard]] const request::OperationInfo &info() const noexcept {
            return _info;
        }

        /**
         * Member list the operation is about to return (for example the layers of a group in a
         * capabilities document).
         */
        void setMembers(std::vector<std::string> members) {
            _members = std::move(members);
        }
        [[nodiscard]] const std::optional<std::vector<std::string>> &members() const noexcept {
            return _members;
        }

        [[nodiscard]] const std::optional<decision::Decision> &decision() const noexcept {
            return _decision;
        }
    };

    /**
     * The single chokepoint in front of the service logic. On Deny raises errors::AccessDenied
     * (message "Forbidden"); on AllowFiltered narrows the operation's member list to what the
     * caller may see.
     */
    class AccessInterceptor {
        const decision::AccessManager &_manager;

        static void narrowMembers(Operation &operation, const std::vector<std::string> &allowed);

    public:
        explicit AccessInterceptor(const decision::AccessManager &manager) : _manager(manager) {
        }

        const decision::Decision &intercept(Operation &operation) const;
    };

} // namespace interception
