#include "interception/access_interceptor.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include <algorithm>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.interception.AccessInterceptor");

namespace interception {

    void AccessInterceptor::narrowMembers(
        Operation &operation, const std::vector<std::string> &allowed) {
        if(!operation._members.has_value()) {
            operation._members = allowed;
            return;
        }
        auto &members = operation._members.value();
        members.erase(
            std::remove_if(
                members.begin(),
                members.end(),
                [&allowed](const std::string &member) {
                    return std::find(allowed.begin(), allowed.end(), member) == allowed.end();
                }),
            members.end());
    }

    const decision::Decision &AccessInterceptor::intercept(Operation &operation) const {
        if(!operation._decision.has_value()) {
            auto key = request::RequestContextBuilder::build(operation._principal, operation._info);
            operation._decision = _manager.decide(key, operation._cancel);
            if(operation._decision->kind() == decision::Decision::Kind::ALLOW_FILTERED) {
                narrowMembers(operation, operation._decision->allowedMembers());
            }
        }
        const auto &decision = operation._decision.value();
        if(decision.isDenied()) {
            LOG.atDebug()
                .event("operation-aborted")
                .kv("service", operation._info.service)
                .kv("request", operation._info.operation)
                .kv("layer", operation._info.layer)
                .log();
            throw errors::AccessDenied();
        }
        return decision;
    }

} // namespace interception
