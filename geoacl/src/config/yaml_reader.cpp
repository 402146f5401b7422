#include "config/yaml_reader.hpp"
#include "catalog/memory_catalog.hpp"
#include "errors/error_base.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.config.YamlReader");

namespace config {

    namespace {
        std::string upper(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
                return static_cast<char>(std::toupper(c));
            });
            return value;
        }

        template<typename T>
        T scalar(const YAML::Node &node, const std::string &key) {
            if(!node.IsScalar()) {
                throw errors::ConfigError("Expecting a scalar for '" + key + "'");
            }
            try {
                return node.as<T>();
            } catch(const YAML::Exception &) {
                throw errors::ConfigError("Bad value for '" + key + "': " + node.Scalar());
            }
        }

        std::string text(const YAML::Node &node, const std::string &key, const std::string &fallback) {
            if(!node || node.IsNull()) {
                return fallback;
            }
            return scalar<std::string>(node, key);
        }

        std::vector<std::string> textList(const YAML::Node &node, const std::string &key) {
            std::vector<std::string> out;
            if(!node || node.IsNull()) {
                return out;
            }
            if(node.IsScalar()) {
                out.push_back(node.Scalar());
                return out;
            }
            if(!node.IsSequence()) {
                throw errors::ConfigError("Expecting a list for '" + key + "'");
            }
            for(auto item : node) {
                out.push_back(scalar<std::string>(item, key));
            }
            return out;
        }

        std::string where(const char *section, size_t index) {
            return std::string(section) + "[" + std::to_string(index) + "]";
        }
    } // namespace

    PolicyDocument YamlReader::read(const std::filesystem::path &path) {
        std::ifstream stream{path};
        if(!stream) {
            throw errors::ConfigError("Unable to read config file " + path.string());
        }
        try {
            return load(YAML::Load(stream));
        } catch(const YAML::Exception &e) {
            throw errors::ConfigError("Malformed YAML in " + path.string() + ": " + e.what());
        }
    }

    PolicyDocument YamlReader::parse(std::string_view text) {
        try {
            return load(YAML::Load(std::string(text)));
        } catch(const YAML::Exception &e) {
            throw errors::ConfigError(std::string("Malformed YAML: ") + e.what());
        }
    }

    PolicyDocument YamlReader::load(const YAML::Node &root) {
        PolicyDocument doc;
        if(!root || root.IsNull()) {
            return doc;
        }
        if(!root.IsMap()) {
            throw errors::ConfigError("Expecting a map at the document root");
        }
        if(auto node = root["accessManager"]; node && !node.IsNull()) {
            readAccessManager(node, doc.accessManager);
        }
        if(auto node = root["rules"]; node && !node.IsNull()) {
            if(!node.IsSequence()) {
                throw errors::ConfigError("Expecting a list for 'rules'");
            }
            for(size_t i = 0; i < node.size(); ++i) {
                doc.rules.push_back(readRule(node[i], i));
            }
        }
        if(auto node = root["operations"]; node && !node.IsNull()) {
            if(!node.IsSequence()) {
                throw errors::ConfigError("Expecting a list for 'operations'");
            }
            for(size_t i = 0; i < node.size(); ++i) {
                doc.accessManager.operations.push_back(readOperation(node[i], i));
            }
        }
        if(auto node = root["catalog"]; node && !node.IsNull()) {
            if(!node.IsSequence()) {
                throw errors::ConfigError("Expecting a list for 'catalog'");
            }
            for(size_t i = 0; i < node.size(); ++i) {
                doc.catalog.push_back(readCatalogEntry(node[i], i));
            }
        }
        doc.accessManager.validate();
        LOG.atDebug()
            .event("config-read")
            .kv("serviceUrl", doc.accessManager.serviceUrl)
            .kv("rules", doc.rules.size())
            .kv("resources", doc.catalog.size())
            .log();
        return doc;
    }

    void YamlReader::readAccessManager(const YAML::Node &node, AccessManagerConfig &config) {
        if(!node.IsMap()) {
            throw errors::ConfigError("Expecting a map for 'accessManager'");
        }
        config.serviceUrl = text(node["serviceUrl"], "accessManager.serviceUrl", config.serviceUrl);
        if(auto value = node["grantWriteToAuthenticatedUsers"]; value && !value.IsNull()) {
            config.grantWriteToAuthenticatedUsers =
                scalar<bool>(value, "accessManager.grantWriteToAuthenticatedUsers");
        }
        config.adminRole = text(node["adminRole"], "accessManager.adminRole", config.adminRole);
        if(auto value = node["timeoutMs"]; value && !value.IsNull()) {
            config.timeout = std::chrono::milliseconds(scalar<int64_t>(value, "accessManager.timeoutMs"));
        }
        if(auto value = node["logLevel"]; value && !value.IsNull()) {
            auto name = scalar<std::string>(value, "accessManager.logLevel");
            auto level = logging::LogManager::parseLevel(name);
            if(!level.has_value()) {
                throw errors::ConfigError("Bad value for 'accessManager.logLevel': " + name);
            }
            config.logLevel = level;
        }
    }

    rules::Rule YamlReader::readRule(const YAML::Node &node, size_t index) {
        auto at = where("rules", index);
        if(!node.IsMap()) {
            throw errors::ConfigError("Expecting a map for '" + at + "'");
        }
        rules::Rule rule;
        try {
            auto grant = rules::parseGrant(text(node["grant"], at + ".grant", "ALLOW"));
            if(!grant.has_value()) {
                throw errors::ConfigError("Bad value for '" + at + ".grant'");
            }
            auto access = rules::parseAccessMode(text(node["access"], at + ".access", "READ"));
            if(!access.has_value()) {
                throw errors::ConfigError("Bad value for '" + at + ".access'");
            }
            rule.grant = grant.value();
            rule.access = access.value();
            rule.workspace = rules::NamePattern::compile(text(node["workspace"], at + ".workspace", "*"));
            rule.layer = rules::NamePattern::compile(text(node["layer"], at + ".layer", "*"));
            rule.service = rules::NamePattern::compile(text(node["service"], at + ".service", "*"), true);
            rule.operation =
                rules::NamePattern::compile(text(node["request"], at + ".request", "*"), true);
            if(auto value = node["priority"]; value && !value.IsNull()) {
                rule.priority = scalar<int64_t>(value, at + ".priority");
            }
            for(auto &role : textList(node["roles"], at + ".roles")) {
                rule.roles.insert(std::move(role));
            }
            auto range = text(node["addressRange"], at + ".addressRange", "");
            if(!range.empty()) {
                rule.addressRange = rules::AddressRange::parse(range);
            }
        } catch(const errors::RuleError &e) {
            throw errors::ConfigError("Bad rule '" + at + "': " + e.what());
        }
        return rule;
    }

    OperationMapping YamlReader::readOperation(const YAML::Node &node, size_t index) {
        auto at = where("operations", index);
        if(!node.IsMap()) {
            throw errors::ConfigError("Expecting a map for '" + at + "'");
        }
        OperationMapping mapping;
        mapping.service = upper(text(node["service"], at + ".service", ""));
        mapping.operation = upper(text(node["request"], at + ".request", "*"));
        auto access = rules::parseAccessMode(text(node["access"], at + ".access", "READ"));
        if(!access.has_value()) {
            throw errors::ConfigError("Bad value for '" + at + ".access'");
        }
        mapping.access = access.value();
        if(auto value = node["listing"]; value && !value.IsNull()) {
            mapping.listing = scalar<bool>(value, at + ".listing");
        }
        return mapping;
    }

    CatalogEntry YamlReader::readCatalogEntry(const YAML::Node &node, size_t index) {
        auto at = where("catalog", index);
        if(!node.IsMap()) {
            throw errors::ConfigError("Expecting a map for '" + at + "'");
        }
        CatalogEntry entry;
        entry.id = text(node["id"], at + ".id", "");
        if(entry.id.empty()) {
            throw errors::ConfigError("Missing '" + at + ".id'");
        }
        auto kind = upper(text(node["kind"], at + ".kind", "LAYER"));
        if(kind == "GROUP") {
            entry.kind = catalog::ResourceKind::GROUP;
        } else if(kind != "LAYER") {
            throw errors::ConfigError("Bad value for '" + at + ".kind': " + kind);
        }
        entry.members = textList(node["members"], at + ".members");
        if(!entry.members.empty() && entry.kind != catalog::ResourceKind::GROUP) {
            throw errors::ConfigError("Only a group can have members: '" + at + "'");
        }
        return entry;
    }

    void YamlReader::populate(
        const std::vector<CatalogEntry> &entries, catalog::MemoryCatalog &target) {
        try {
            target.batch([&entries](catalog::MemoryCatalog &c) {
                for(const auto &entry : entries) {
                    c.add(entry.id, entry.kind);
                }
                for(const auto &entry : entries) {
                    for(const auto &member : entry.members) {
                        c.attach(member, entry.id);
                    }
                }
            });
        } catch(const std::invalid_argument &e) {
            throw errors::ConfigError(std::string("Bad catalog: ") + e.what());
        }
    }

} // namespace config
