#include "errors/error_base.hpp"
#include "lifecycle/command_line.hpp"
#include "support/log_capture.hpp"
#include <catch2/catch_all.hpp>

// NOLINTBEGIN
SCENARIO("Command line parsing", "[lifecycle]") {
    GIVEN("A full set of arguments") {
        lifecycle::CommandLine cli;
        cli.parseArgs(
            {"--config",
             "policy.yaml",
             "-u",
             "alice",
             "-r",
             "ROLE_ONE",
             "--ROLE",
             "ROLE_TWO",
             "-s",
             "WMS",
             "-o",
             "GetMap",
             "-w",
             "topp",
             "-l",
             "states",
             "-a",
             "10.0.0.1"});
        THEN("Every value is captured") {
            REQUIRE(cli.configPath().string() == "policy.yaml");
            REQUIRE_FALSE(cli.helpRequested());
            auto principal = cli.principal();
            REQUIRE(principal.has_value());
            REQUIRE(principal->name == "alice");
            REQUIRE(principal->roles == std::set<std::string>{"ROLE_ONE", "ROLE_TWO"});
            REQUIRE(cli.operationInfo().service == "WMS");
            REQUIRE(cli.operationInfo().operation == "GetMap");
            REQUIRE(cli.operationInfo().workspace == "topp");
            REQUIRE(cli.operationInfo().layer == "states");
            REQUIRE(cli.operationInfo().sourceAddress == "10.0.0.1");
        }
    }
    GIVEN("No user") {
        lifecycle::CommandLine cli;
        cli.parseArgs({"-c", "policy.yaml", "-r", "ROLE_ONE"});
        THEN("The caller is anonymous") {
            REQUIRE_FALSE(cli.principal().has_value());
        }
    }
    GIVEN("Only a help request") {
        lifecycle::CommandLine cli;
        cli.parseArgs({"-h"});
        THEN("No configuration is needed") {
            REQUIRE(cli.helpRequested());
            REQUIRE(lifecycle::CommandLine::usage().find("--config") != std::string::npos);
        }
    }
    GIVEN("Bad arguments") {
        test_support::LogCapture capture{logging::Level::None};
        lifecycle::CommandLine cli;
        THEN("They are rejected") {
            REQUIRE_THROWS_AS(cli.parseArgs({"--bogus"}), errors::CommandLineArgumentError);
            REQUIRE_THROWS_AS(cli.parseArgs({"-c"}), errors::CommandLineArgumentError);
            REQUIRE_THROWS_AS(cli.parseArgs({"-c", ""}), errors::CommandLineArgumentError);
            REQUIRE_THROWS_AS(cli.parseArgs({"-u", "alice"}), errors::CommandLineArgumentError);
        }
    }
}
// NOLINTEND
