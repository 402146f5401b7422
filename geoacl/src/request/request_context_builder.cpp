#include "request/request_context_builder.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include "request/resource_id.hpp"
#include <algorithm>
#include <cctype>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.request.RequestContextBuilder");

namespace request {

    DecisionKey RequestContextBuilder::build(
        const std::optional<Principal> &principal, const OperationInfo &operation) {

        std::optional<std::string> user;
        std::set<std::string> roles;
        if(principal.has_value()) {
            user = principal->name;
            for(const auto &role : principal->roles) {
                if(!role.empty()) {
                    roles.insert(role);
                }
            }
        }

        std::optional<std::string> workspace = operation.workspace;
        std::optional<std::string> layer = operation.layer;
        splitQualifiedLayer(workspace, layer);

        return DecisionKey{
            std::move(user),
            std::move(roles),
            canonicalName(operation.service, "service"),
            canonicalName(operation.operation, "operation"),
            std::move(workspace),
            std::move(layer),
            operation.subfield,
            operation.sourceAddress};
    }

    std::string RequestContextBuilder::canonicalName(
        const std::optional<std::string> &value, const char *field) {
        if(!value.has_value()) {
            if(!logging::LogManager::get().isEnabled(logging::Level::Debug)) {
                return {};
            }
            errors::InvalidRequestContext missing{std::string("Missing ") + field};
            LOG.atDebug()
                .event("request-context-recovered")
                .kv("field", field)
                .cause(missing)
                .log("Treating missing field as empty");
            return {};
        }
        std::string out{value.value()};
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::toupper(c));
        });
        return out;
    }

    void RequestContextBuilder::splitQualifiedLayer(
        std::optional<std::string> &workspace, std::optional<std::string> &layer) {
        if(!layer.has_value() || layer->find(ResourceId::SEPARATOR) == std::string::npos) {
            return;
        }
        auto qualified = ResourceId::parse(layer.value());
        if(!workspace.has_value()) {
            workspace = qualified.workspace;
            layer = qualified.name;
        } else if(workspace == qualified.workspace) {
            layer = qualified.name;
        } else if(logging::LogManager::get().isEnabled(logging::Level::Debug)) {
            errors::InvalidRequestContext conflict{"Layer prefix does not match workspace"};
            LOG.atDebug()
                .event("request-context-recovered")
                .kv("workspace", workspace)
                .kv("layer", layer)
                .cause(conflict)
                .log("Keeping layer name as given");
        }
    }

} // namespace request
