#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace request {

    /**
     * Catalog resource identifiers are "workspace:name" for workspace-scoped resources and a
     * bare "name" for global resources (layer groups without a workspace).
     */
    struct ResourceId {
        static constexpr char SEPARATOR = ':';

        std::optional<std::string> workspace;
        std::string name;

        static ResourceId parse(std::string_view id) {
            ResourceId out;
            auto pos = id.find(SEPARATOR);
            if(pos == std::string_view::npos) {
                out.name = id;
            } else {
                out.workspace = std::string(id.substr(0, pos));
                out.name = id.substr(pos + 1);
            }
            return out;
        }

        static std::string join(const std::optional<std::string> &workspace, std::string_view name) {
            if(!workspace.has_value()) {
                return std::string(name);
            }
            std::string out{workspace.value()};
            out.push_back(SEPARATOR);
            out.append(name);
            return out;
        }

        [[nodiscard]] std::string str() const {
            return join(workspace, name);
        }
    };

} // namespace request
