#include "errors/error_base.hpp"

namespace errors {
    std::string_view ServiceUnavailable::failureName(Failure failure) noexcept {
        switch(failure) {
            case Failure::CONNECT:
                return "connect";
            case Failure::TIMEOUT:
                return "timeout";
            case Failure::BAD_STATUS:
                return "bad-status";
            case Failure::BAD_RESPONSE:
                return "bad-response";
        }
        return "unknown";
    }
} // namespace errors
