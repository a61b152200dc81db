#include <doctest/doctest.h>

#include "cli/RunOptions.hpp"

#include <sstream>
#include <vector>

namespace {
auto make_argv(std::initializer_list<const char*> list) {
    std::vector<char*> argv;
    argv.reserve(list.size());
    for (auto* value : list) {
        argv.push_back(const_cast<char*>(value));
    }
    return argv;
}
}

using namespace CT;
using namespace CT::CLI;

TEST_SUITE("cli.run_options") {

TEST_CASE("defaults without arguments") {
    auto argv    = make_argv({"casetree"});
    auto options = ParseRunArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->configPath == std::filesystem::path{"config.json"});
    CHECK_FALSE(options->logLevel.has_value());
    CHECK_FALSE(options->targetRoot.has_value());
    CHECK_FALSE(options->showHelp);
}

TEST_CASE("all options") {
    auto argv    = make_argv({"casetree", "--config", "run.json", "--log-level=debug", "--target", "/srv/out", "-h"});
    auto options = ParseRunArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->configPath == std::filesystem::path{"run.json"});
    CHECK(options->logLevel == LogLevel::Debug);
    CHECK(options->targetRoot == std::filesystem::path{"/srv/out"});
    CHECK(options->showHelp);
}

TEST_CASE("values may contain spaces and equals signs") {
    auto argv    = make_argv({"casetree", "--target", "out dir", "--config=a=b.json"});
    auto options = ParseRunArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->targetRoot == std::filesystem::path{"out dir"});
    CHECK(options->configPath == std::filesystem::path{"a=b.json"});
}

TEST_CASE("later occurrences win") {
    auto argv    = make_argv({"casetree", "--log-level", "error", "--log-level", "warn"});
    auto options = ParseRunArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->logLevel == LogLevel::Warning);
}

TEST_CASE("short config alias") {
    auto argv    = make_argv({"casetree", "-c", "other.json"});
    auto options = ParseRunArguments(static_cast<int>(argv.size()), argv.data());
    REQUIRE(options.has_value());
    CHECK(options->configPath == std::filesystem::path{"other.json"});
}

TEST_CASE("invalid arguments") {
    SUBCASE("unknown level") {
        auto argv = make_argv({"casetree", "--log-level", "loud"});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
    SUBCASE("missing value") {
        auto argv = make_argv({"casetree", "--target"});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
    SUBCASE("empty attached value") {
        auto argv = make_argv({"casetree", "--config="});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
    SUBCASE("option in place of a value") {
        auto argv = make_argv({"casetree", "--config", "--help"});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
    SUBCASE("help with a value") {
        auto argv = make_argv({"casetree", "--help=yes"});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
    SUBCASE("positional argument") {
        auto argv = make_argv({"casetree", "main.csv"});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
    SUBCASE("unknown option") {
        auto argv = make_argv({"casetree", "--dry-run"});
        CHECK_FALSE(ParseRunArguments(static_cast<int>(argv.size()), argv.data()).has_value());
    }
}

TEST_CASE("command line values override the config") {
    RunConfig config;
    config.logLevel   = LogLevel::Error;
    config.targetRoot = "from-config";

    RunOptions none;
    ApplyRunOptions(config, none);
    CHECK(config.logLevel == LogLevel::Error);
    CHECK(config.targetRoot == std::filesystem::path{"from-config"});

    RunOptions options;
    options.logLevel   = LogLevel::Debug;
    options.targetRoot = std::filesystem::path{"from-cli"};
    ApplyRunOptions(config, options);
    CHECK(config.logLevel == LogLevel::Debug);
    CHECK(config.targetRoot == std::filesystem::path{"from-cli"});
}

TEST_CASE("usage lists every option") {
    std::ostringstream out;
    PrintRunUsage(out);
    auto const text = out.str();
    for (auto option : {"--config", "--log-level", "--target", "--help"}) {
        CAPTURE(option);
        CHECK(text.find(option) != std::string::npos);
    }
}

} // TEST_SUITE
