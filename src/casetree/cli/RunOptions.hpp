#pragma once
#include "config/RunConfig.hpp"
#include "log/TaggedLogger.hpp"

#include <filesystem>
#include <optional>
#include <ostream>

namespace CT::CLI {

struct RunOptions {
    std::filesystem::path                configPath{DefaultConfigFile};
    std::optional<LogLevel>              logLevel;
    std::optional<std::filesystem::path> targetRoot;
    bool                                 showHelp{false};
};

auto ParseRunArguments(int argc, char** argv) -> std::optional<RunOptions>;

void PrintRunUsage(std::ostream& out);

// Command line values take precedence over the config file.
void ApplyRunOptions(RunConfig& config, RunOptions const& options);

} // namespace CT::CLI
