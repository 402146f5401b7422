#pragma once
#include "lifecycle/command_line_arguments.hpp"
#include "request/request_context_builder.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lifecycle {

    /**
     * Arguments of geoacl-check: which configuration to load and the one request to evaluate.
     */
    class CommandLine {
        std::filesystem::path _configPath;
        std::optional<std::string> _user;
        std::set<std::string> _roles;
        request::OperationInfo _info;
        bool _helpRequested{false};

        template<class V, class... T>
        static std::unique_ptr<argument> makeEntry(T &&...t) {
            return std::unique_ptr<argument>(std::make_unique<V>(std::forward<T>(t)...));
        }

    public:
        static const std::unique_ptr<argument> argumentList[];

        void parseArgs(const std::vector<std::string> &args);

        [[nodiscard]] static std::string usage();

        [[nodiscard]] bool helpRequested() const noexcept {
            return _helpRequested;
        }
        [[nodiscard]] const std::filesystem::path &configPath() const noexcept {
            return _configPath;
        }

        /**
         * The caller: none when no user was given, otherwise the user with the given roles.
         */
        [[nodiscard]] std::optional<request::Principal> principal() const;

        [[nodiscard]] const request::OperationInfo &operationInfo() const noexcept {
            return _info;
        }
    };

} // namespace lifecycle
