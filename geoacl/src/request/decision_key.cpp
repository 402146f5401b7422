#include "request/decision_key.hpp"
#include "request/resource_id.hpp"

namespace request {

    DecisionKey::DecisionKey(
        std::optional<std::string> user,
        std::set<std::string> roles,
        std::string service,
        std::string operation,
        std::optional<std::string> workspace,
        std::optional<std::string> layer,
        std::optional<std::string> subfield,
        std::optional<std::string> sourceAddress)
        : _user(std::move(user)), _roles(std::move(roles)), _service(std::move(service)),
          _operation(std::move(operation)), _workspace(std::move(workspace)),
          _layer(std::move(layer)), _subfield(std::move(subfield)),
          _sourceAddress(std::move(sourceAddress)) {
    }

    std::optional<std::string> DecisionKey::resourceId() const {
        if(!_layer.has_value()) {
            return {};
        }
        return ResourceId::join(_workspace, _layer.value());
    }

    DecisionKey DecisionKey::withResource(
        std::optional<std::string> workspace, std::optional<std::string> layer) const {
        DecisionKey copy{*this};
        copy._workspace = std::move(workspace);
        copy._layer = std::move(layer);
        copy._subfield.reset();
        return copy;
    }

    bool DecisionKey::operator==(const DecisionKey &other) const {
        return _user == other._user && _roles == other._roles && _service == other._service
               && _operation == other._operation && _workspace == other._workspace
               && _layer == other._layer && _subfield == other._subfield
               && _sourceAddress == other._sourceAddress;
    }

    namespace {
        void printOptional(std::ostream &os, const char *name, const std::optional<std::string> &v) {
            os << name << '=';
            if(v.has_value()) {
                os << '"' << v.value() << '"';
            } else {
                os << "<unset>";
            }
        }
    } // namespace

    std::ostream &operator<<(std::ostream &os, const DecisionKey &key) {
        os << "DecisionKey{";
        printOptional(os, "user", key.user());
        os << ", roles=[";
        bool first = true;
        for(const auto &role : key.roles()) {
            os << (first ? "" : ",") << role;
            first = false;
        }
        os << "], service=" << key.service() << ", operation=" << key.operation() << ", ";
        printOptional(os, "workspace", key.workspace());
        os << ", ";
        printOptional(os, "layer", key.layer());
        os << ", ";
        printOptional(os, "subfield", key.subfield());
        os << ", ";
        printOptional(os, "sourceAddress", key.sourceAddress());
        return os << '}';
    }

} // namespace request
