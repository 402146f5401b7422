#include "lifecycle/command_line.hpp"
#include "logging/logger.hpp"
#include <sstream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.lifecycle.CommandLine");

namespace lifecycle {

    namespace {
        CommandLine &self(void *parent) {
            return *reinterpret_cast<CommandLine *>(parent);
        }
    } // namespace

    const std::unique_ptr<argument> CommandLine::argumentList[] = {
        makeEntry<argumentFlag>(
            [](void *parent) { self(parent)._helpRequested = true; },
            "h",
            "help",
            "Print this usage information"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._configPath = arg; },
            "c",
            "config",
            "Policy configuration (YAML)"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._user = arg; },
            "u",
            "user",
            "Authenticated user; omit for an anonymous caller"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._roles.insert(arg); },
            "r",
            "role",
            "Role held by the user (repeatable)"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._info.service = arg; },
            "s",
            "service",
            "Service name, e.g. WMS"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._info.operation = arg; },
            "o",
            "operation",
            "Operation name, e.g. GetMap"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._info.workspace = arg; },
            "w",
            "workspace",
            "Target workspace"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._info.layer = arg; },
            "l",
            "layer",
            "Target layer or group"),
        makeEntry<argumentValue<std::string>>(
            [](void *parent, const std::string &arg) { self(parent)._info.sourceAddress = arg; },
            "a",
            "address",
            "Source address of the request")};

    void CommandLine::parseArgs(const std::vector<std::string> &args) {
        for(auto i = args.begin(); i != args.end(); i++) {
            bool handled = false;
            for(const auto &j : argumentList) {
                if(j->process(this, i, args.end())) {
                    handled = true;
                    break;
                }
            }
            if(!handled) {
                LOG.atError()
                    .event("parse-args-error")
                    .logAndThrow(errors::CommandLineArgumentError{
                        std::string("Unrecognized argument: ") + *i});
            }
        }
        if(!_helpRequested && _configPath.empty()) {
            LOG.atError()
                .event("parse-args-error")
                .logAndThrow(errors::CommandLineArgumentError{"No configuration given (--config)"});
        }
    }

    std::string CommandLine::usage() {
        std::ostringstream os;
        os << "Usage: geoacl-check --config <file> [options]\n";
        for(const auto &a : argumentList) {
            os << a->getDescription() << '\n';
        }
        return os.str();
    }

    std::optional<request::Principal> CommandLine::principal() const {
        if(!_user.has_value()) {
            return {};
        }
        return request::Principal{_user.value(), _roles};
    }

} // namespace lifecycle
