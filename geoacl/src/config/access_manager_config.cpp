#include "config/access_manager_config.hpp"
#include "errors/error_base.hpp"

namespace config {

    bool AccessManagerConfig::isInternal() const {
        return serviceUrl.empty() || serviceUrl == INTERNAL
               || serviceUrl == std::string(INTERNAL) + ":/";
    }

    void AccessManagerConfig::validate() const {
        if(!isInternal()) {
            if(serviceUrl.rfind("http://", 0) != 0 && serviceUrl.rfind("https://", 0) != 0) {
                throw errors::ConfigError("serviceUrl must be 'internal' or an http(s) URL: " + serviceUrl);
            }
            if(timeout <= std::chrono::milliseconds::zero()) {
                throw errors::ConfigError("timeout must be positive for a remote serviceUrl");
            }
        }
        if(adminRole.empty()) {
            throw errors::ConfigError("adminRole must not be empty");
        }
        for(const auto &mapping : operations) {
            if(mapping.service.empty() || mapping.operation.empty()) {
                throw errors::ConfigError("operations entries need both service and request");
            }
        }
    }

} // namespace config
