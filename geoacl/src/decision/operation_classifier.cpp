#include "decision/operation_classifier.hpp"
#include <array>

namespace decision {

    namespace {
        constexpr std::array<std::string_view, 3> WFS_WRITES{
            "TRANSACTION", "LOCKFEATURE", "GETFEATUREWITHLOCK"};
        constexpr std::array<std::string_view, 4> REST_WRITES{"POST", "PUT", "DELETE", "PATCH"};

        template<size_t N>
        bool oneOf(const std::array<std::string_view, N> &names, std::string_view value) {
            for(auto name : names) {
                if(name == value) {
                    return true;
                }
            }
            return false;
        }
    } // namespace

    Classification OperationClassifier::builtin(std::string_view service, std::string_view operation) {
        using rules::AccessMode;
        if(service == "WFS" && oneOf(WFS_WRITES, operation)) {
            return {AccessMode::WRITE, false};
        }
        if(service == "WCS-T") {
            return {AccessMode::WRITE, false};
        }
        if(service == "REST" && oneOf(REST_WRITES, operation)) {
            return {AccessMode::WRITE, false};
        }
        if(operation == "GETCAPABILITIES" || (service == "WMS" && operation == "GETMAP")) {
            return {AccessMode::READ, true};
        }
        return {AccessMode::READ, false};
    }

    Classification OperationClassifier::classify(
        std::string_view service, std::string_view operation) const {
        const config::OperationMapping *wildcard = nullptr;
        for(const auto &mapping : _overrides) {
            if(mapping.service != service) {
                continue;
            }
            if(mapping.operation == operation) {
                return {mapping.access, mapping.listing};
            }
            if(mapping.operation == "*" && wildcard == nullptr) {
                wildcard = &mapping;
            }
        }
        if(wildcard != nullptr) {
            return {wildcard->access, wildcard->listing};
        }
        return builtin(service, operation);
    }

} // namespace decision
