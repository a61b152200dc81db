#include "Pipeline.hpp"
#include "cli/RunOptions.hpp"
#include "config/RunConfig.hpp"
#include "log/TaggedLogger.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace {

auto fatal(std::string const& message) -> int {
    ct_log(message, "ERROR", "Main");
    return EXIT_FAILURE;
}

auto run(int argc, char** argv) -> int {
    auto options = CT::CLI::ParseRunArguments(argc, argv);
    if (!options) {
        CT::CLI::PrintRunUsage(std::cerr);
        return EXIT_FAILURE;
    }
    if (options->showHelp) {
        CT::CLI::PrintRunUsage(std::cout);
        return EXIT_SUCCESS;
    }

    std::error_code ec;
    auto const      workingDirectory = std::filesystem::current_path(ec);
    if (ec) {
        return fatal("Cannot determine working directory: " + ec.message());
    }
    ct_log("Program started. Working directory: " + workingDirectory.string(), "INFO", "Main");

    ct_log("Loading config " + options->configPath.string() + "...", "INFO", "Main");
    auto loaded = CT::LoadRunConfig(options->configPath);
    if (!loaded) {
        return fatal("Could not load configuration: " + CT::describeError(loaded.error()));
    }
    CT::CLI::ApplyRunOptions(*loaded, *options);
    auto const config = CT::ResolveRunConfigPaths(std::move(*loaded), workingDirectory);

    CT::set_log_level(config.logLevel);
    if (auto opened = CT::logger().openLogFile(config.logFile); !opened) {
        ct_log("Logging to stderr only: " + CT::describeError(opened.error()), "WARNING", "Main");
    }

    if (auto problem = CT::ValidateRunConfig(config)) {
        return fatal(*problem);
    }

    auto summary = CT::RunPipeline(config);
    if (!summary) {
        return fatal("Run aborted: " + CT::describeError(summary.error()));
    }
    ct_log("Done.", "INFO", "Main");
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (std::exception const& ex) {
        return fatal(std::string{"Fatal error in main(): "} + ex.what());
    }
}
