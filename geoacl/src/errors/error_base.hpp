#pragma once
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace errors {

    /**
     * Base class for access manager exceptions. This exception class carries through a "kind"
     * string so that failures can be classified in logs and diagnostics.
     */
    class Error : public std::runtime_error {
        std::string _kind;

    public:
        Error(const Error &) = default;
        Error(Error &&) noexcept = default;
        Error &operator=(const Error &) = default;
        Error &operator=(Error &&) noexcept = default;
        ~Error() override = default;

        explicit Error(std::string kind, const std::string &what = "Unspecified Error")
            : std::runtime_error(what), _kind(std::move(kind)) {
        }

        template<typename E>
        static Error of(const E &error) {
            static_assert(std::is_base_of_v<std::exception, E>);
            return Error(typeid(E).name(), error.what());
        }

        [[nodiscard]] const std::string &kind() const noexcept {
            return _kind;
        }
    };

    template<>
    inline Error Error::of<Error>(const Error &error) {
        return error;
    }

    /**
     * Raw operation information could not be normalized. Recovered by the request builder, which
     * treats the offending field as unset.
     */
    class InvalidRequestContext : public Error {
    public:
        explicit InvalidRequestContext(const std::string &msg)
            : Error("InvalidRequestContext", msg) {
        }
    };

    /**
     * The authorization backend could not answer a rule query.
     */
    class ServiceUnavailable : public Error {
    public:
        enum class Failure { CONNECT, TIMEOUT, BAD_STATUS, BAD_RESPONSE };

    private:
        Failure _failure;

    public:
        ServiceUnavailable(Failure failure, const std::string &msg)
            : Error("ServiceUnavailable", msg), _failure(failure) {
        }

        [[nodiscard]] Failure failure() const noexcept {
            return _failure;
        }

        static std::string_view failureName(Failure failure) noexcept;
    };

    class Cancelled : public Error {
    public:
        explicit Cancelled(const std::string &msg = "Evaluation cancelled")
            : Error("Cancelled", msg) {
        }
    };

    class CatalogUnavailable : public Error {
    public:
        explicit CatalogUnavailable(const std::string &msg) : Error("CatalogUnavailable", msg) {
        }
    };

    class ContainmentIndexUnavailable : public Error {
    public:
        explicit ContainmentIndexUnavailable(const std::string &msg)
            : Error("ContainmentIndexUnavailable", msg) {
        }
    };

    class ContainmentCycle : public Error {
    public:
        explicit ContainmentCycle(const std::string &msg) : Error("ContainmentCycle", msg) {
        }
    };

    class ConfigError : public Error {
    public:
        explicit ConfigError(const std::string &msg) : Error("ConfigError", msg) {
        }
    };

    class RuleError : public Error {
    public:
        explicit RuleError(const std::string &msg) : Error("RuleError", msg) {
        }
    };

    /**
     * Raised by the interception point when an operation must not proceed. The message is always
     * generic; the reason for the denial is only ever logged.
     */
    class AccessDenied : public Error {
    public:
        AccessDenied() : Error("AccessDenied", "Forbidden") {
        }
    };

    class CommandLineArgumentError : public Error {
    public:
        explicit CommandLineArgumentError(const std::string &msg)
            : Error("CommandLineArgumentError", msg) {
        }
    };

} // namespace errors
