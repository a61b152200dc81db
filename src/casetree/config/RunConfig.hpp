#pragma once
#include "core/Error.hpp"
#include "csv/TextEncoding.hpp"
#include "log/TaggedLogger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace CT {

// Every value has a default; a config file only needs the keys it changes.
struct RunConfig {
    std::filesystem::path                primaryCsv{"main.csv"};
    std::filesystem::path                nestedCsv{"nested.csv"};
    std::optional<std::filesystem::path> checkCsv;

    std::filesystem::path primaryErrorCsv{"errors/main_errors.csv"};
    std::filesystem::path nestedErrorCsv{"errors/nested_errors.csv"};
    std::filesystem::path checkErrorCsv{"errors/check_errors.csv"};

    std::filesystem::path targetRoot{"output"};
    std::filesystem::path homepageSource{"source/homepage"};
    std::filesystem::path individualGateSource{"source/individual_gate"};

    std::string homepageSubdir{"Homepage"};
    std::string individualGateSubdir{"Individual Gate"};

    LogLevel              logLevel{LogLevel::Info};
    std::filesystem::path logFile{"debug.log"};

    Csv::TextEncoding checkEncoding{Csv::TextEncoding::Windows1252};
    bool              routeMalformedCheckRows{false};
    bool              strictIdentifiers{true};
};

inline constexpr std::string_view DefaultConfigFile = "config.json";

// Reads values and types only; nothing on disk is consulted.
[[nodiscard]] auto ParseRunConfig(std::string_view jsonText) -> Expected<RunConfig>;

[[nodiscard]] auto LoadRunConfig(std::filesystem::path const& file) -> Expected<RunConfig>;

// Makes every relative path absolute against base.
[[nodiscard]] auto ResolveRunConfigPaths(RunConfig config, std::filesystem::path const& base) -> RunConfig;

// Checks that the inputs and the target root exist, that neither source root
// overlaps the target root and that the slot names are usable as single path
// segments. Returns a message on failure.
[[nodiscard]] auto ValidateRunConfig(RunConfig const& config) -> std::optional<std::string>;

} // namespace CT
