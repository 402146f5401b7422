// geoacl-check: evaluate one request against a policy configuration
#include "catalog/memory_catalog.hpp"
#include "config/yaml_reader.hpp"
#include "decision/access_manager.hpp"
#include "errors/error_base.hpp"
#include "interception/access_interceptor.hpp"
#include "lifecycle/command_line.hpp"
#include "logging/logger.hpp"
#include <iostream>

static const auto LOG = // NOLINT(cert-err58-cpp)
    logging::Logger::of("geoacl.main");

namespace {
    constexpr int EXIT_ALLOW = 0;
    constexpr int EXIT_USAGE = 2;
    constexpr int EXIT_DENY = 3;
} // namespace

int main(int argc, char *argv[]) {
    lifecycle::CommandLine commandLine;
    try {
        commandLine.parseArgs({argv + 1, argv + argc});
    } catch(const errors::CommandLineArgumentError &e) {
        std::cerr << e.what() << '\n' << lifecycle::CommandLine::usage();
        return EXIT_USAGE;
    }
    if(commandLine.helpRequested()) {
        std::cout << lifecycle::CommandLine::usage();
        return EXIT_ALLOW;
    }

    try {
        auto document = config::YamlReader::read(commandLine.configPath());
        catalog::MemoryCatalog catalog;
        config::YamlReader::populate(document.catalog, catalog);
        auto ruleStore = std::make_shared<rules::LocalRuleStore>(std::move(document.rules));
        decision::AccessManager manager(std::move(document.accessManager), ruleStore, catalog);
        interception::AccessInterceptor interceptor(manager);
        interception::Operation operation(commandLine.principal(), commandLine.operationInfo());
        try {
            std::cout << interceptor.intercept(operation) << std::endl;
            return EXIT_ALLOW;
        } catch(const errors::AccessDenied &) {
            std::cout << "DENY" << std::endl;
            return EXIT_DENY;
        }
    } catch(const errors::Error &e) {
        LOG.atError().event("check-failed").kv("kind", e.kind()).cause(e).log();
        std::cerr << e.kind() << ": " << e.what() << std::endl;
        return EXIT_USAGE;
    }
}
