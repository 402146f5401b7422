#pragma once
#include "catalog/catalog.hpp"
#include "config/access_manager_config.hpp"
#include "rules/rule.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace catalog {
    class MemoryCatalog;
}

namespace config {

    struct CatalogEntry {
        std::string id;
        catalog::ResourceKind kind{catalog::ResourceKind::LAYER};
        std::vector<std::string> members;
    };

    /**
     * Everything one configuration file describes.
     */
    struct PolicyDocument {
        AccessManagerConfig accessManager;
        std::vector<rules::Rule> rules;
        std::vector<CatalogEntry> catalog;
    };

    /**
     * Reads a policy document:
     *
     *   accessManager:
     *     serviceUrl: internal
     *     grantWriteToAuthenticatedUsers: false
     *     adminRole: ROLE_ADMINISTRATOR
     *     timeoutMs: 5000
     *     logLevel: info
     *   rules:
     *     - { workspace: topp, layer: states, access: READ, roles: [ROLE_ONE], priority: 1 }
     *   operations:
     *     - { service: WFS, request: TRANSACTION, access: WRITE, listing: false }
     *   catalog:
     *     - { id: "topp:states" }
     *     - { id: base, kind: group, members: ["topp:states"] }
     *
     * Every section is optional and unknown keys are ignored. A value of the wrong shape raises
     * errors::ConfigError naming the key.
     */
    class YamlReader {
    public:
        static PolicyDocument read(const std::filesystem::path &path);
        static PolicyDocument parse(std::string_view text);

        /**
         * Loads catalog entries into an empty catalog. Groups may list members defined later in
         * the document.
         */
        static void populate(const std::vector<CatalogEntry> &entries, catalog::MemoryCatalog &target);

    private:
        static PolicyDocument load(const YAML::Node &root);
        static void readAccessManager(const YAML::Node &node, AccessManagerConfig &config);
        static rules::Rule readRule(const YAML::Node &node, size_t index);
        static OperationMapping readOperation(const YAML::Node &node, size_t index);
        static CatalogEntry readCatalogEntry(const YAML::Node &node, size_t index);
    };

} // namespace config
