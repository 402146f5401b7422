#include "rules/rule_codec.hpp"
#include "errors/error_base.hpp"
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace rules {

    namespace {
        using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

        void writeOptional(Writer &writer, const char *key, const std::optional<std::string> &value) {
            if(value.has_value()) {
                writer.Key(key);
                writer.String(value.value());
            }
        }

        std::string stringMember(
            const rapidjson::Value &object, const char *key, const std::string &fallback) {
            auto it = object.FindMember(key);
            if(it == object.MemberEnd() || it->value.IsNull()) {
                return fallback;
            }
            if(!it->value.IsString()) {
                throw errors::RuleError(std::string("Rule field '") + key + "' must be a string");
            }
            return {it->value.GetString(), it->value.GetStringLength()};
        }

        Rule decodeRule(const rapidjson::Value &object) {
            if(!object.IsObject()) {
                throw errors::RuleError("Rule entry must be an object");
            }
            Rule rule;
            if(auto it = object.FindMember("id"); it != object.MemberEnd()) {
                if(!it->value.IsUint64()) {
                    throw errors::RuleError("Rule field 'id' must be an unsigned integer");
                }
                rule.id = it->value.GetUint64();
            }
            if(auto it = object.FindMember("priority"); it != object.MemberEnd()) {
                if(!it->value.IsInt64()) {
                    throw errors::RuleError("Rule field 'priority' must be an integer");
                }
                rule.priority = it->value.GetInt64();
            }
            auto grant = parseGrant(stringMember(object, "grant", "ALLOW"));
            auto access = parseAccessMode(stringMember(object, "access", "READ"));
            if(!grant.has_value() || !access.has_value()) {
                throw errors::RuleError("Rule has an unknown grant or access mode");
            }
            rule.grant = grant.value();
            rule.access = access.value();
            rule.workspace = NamePattern::compile(stringMember(object, "workspace", "*"));
            rule.layer = NamePattern::compile(stringMember(object, "layer", "*"));
            rule.service = NamePattern::compile(stringMember(object, "service", "*"), true);
            rule.operation = NamePattern::compile(stringMember(object, "request", "*"), true);
            if(auto it = object.FindMember("roles"); it != object.MemberEnd()) {
                if(!it->value.IsArray()) {
                    throw errors::RuleError("Rule field 'roles' must be an array");
                }
                for(const auto &role : it->value.GetArray()) {
                    if(!role.IsString()) {
                        throw errors::RuleError("Rule roles must be strings");
                    }
                    rule.roles.emplace(role.GetString(), role.GetStringLength());
                }
            }
            auto range = stringMember(object, "addressRange", "");
            if(!range.empty()) {
                rule.addressRange = AddressRange::parse(range);
            }
            return rule;
        }
    } // namespace

    std::string RuleCodec::encodeQuery(const request::DecisionKey &key) {
        rapidjson::StringBuffer buffer;
        Writer writer(buffer);
        writer.StartObject();
        writeOptional(writer, "user", key.user());
        writer.Key("roles");
        writer.StartArray();
        for(const auto &role : key.roles()) {
            writer.String(role);
        }
        writer.EndArray();
        writer.Key("service");
        writer.String(key.service());
        writer.Key("request");
        writer.String(key.operation());
        writeOptional(writer, "workspace", key.workspace());
        writeOptional(writer, "layer", key.layer());
        writeOptional(writer, "subfield", key.subfield());
        writeOptional(writer, "sourceAddress", key.sourceAddress());
        writer.EndObject();
        return {buffer.GetString(), buffer.GetSize()};
    }

    std::vector<Rule> RuleCodec::decodeRules(std::string_view body) {
        rapidjson::Document doc;
        doc.Parse(body.data(), body.size());
        if(doc.HasParseError()) {
            throw errors::RuleError(
                std::string("Malformed rule response: ")
                + rapidjson::GetParseError_En(doc.GetParseError()));
        }
        if(!doc.IsObject()) {
            throw errors::RuleError("Rule response must be an object");
        }
        auto it = doc.FindMember("rules");
        if(it == doc.MemberEnd() || !it->value.IsArray()) {
            throw errors::RuleError("Rule response has no 'rules' array");
        }
        std::vector<Rule> out;
        out.reserve(it->value.Size());
        for(const auto &entry : it->value.GetArray()) {
            out.push_back(decodeRule(entry));
        }
        return out;
    }

} // namespace rules
