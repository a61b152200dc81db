#include "RunOptions.hpp"

#include <iostream>
#include <string>
#include <string_view>

namespace CT::CLI {

void PrintRunUsage(std::ostream& out) {
    out << "Usage: casetree [options]\n"
           "Builds <target>/<id>/... from the configured CSV files and writes one error CSV per stage.\n"
           "Options:\n"
           "  --config, -c <file>    JSON configuration (default config.json)\n"
           "  --log-level <level>    debug, info, warning or error (overrides log.level)\n"
           "  --target <dir>         Output root (overrides target.path)\n"
           "  --help, -h             Show this message\n";
}

auto ParseRunArguments(int argc, char** argv) -> std::optional<RunOptions> {
    RunOptions options{};

    // Accepts "--flag value" and "--flag=value". A following token that starts
    // with '-' is never taken as the value.
    auto require_value = [&](int& index, std::string_view flag, std::optional<std::string_view> attached)
        -> std::optional<std::string_view> {
        if (attached) {
            if (attached->empty()) {
                std::cerr << flag << " requires a value\n";
                return std::nullopt;
            }
            return attached;
        }
        if (index + 1 >= argc || std::string_view{argv[index + 1]}.starts_with('-')) {
            std::cerr << flag << " requires a value\n";
            return std::nullopt;
        }
        return std::string_view{argv[++index]};
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view                arg{argv[i]};
        std::optional<std::string_view> attached;
        if (auto equals = arg.find('='); arg.starts_with("--") && equals != std::string_view::npos) {
            attached = arg.substr(equals + 1);
            arg      = arg.substr(0, equals);
        }

        if (arg == "--config" || arg == "-c") {
            if (auto value = require_value(i, "--config", attached)) {
                options.configPath = std::filesystem::path{std::string{*value}};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--log-level") {
            if (auto value = require_value(i, "--log-level", attached)) {
                auto level = logLevelFromString(*value);
                if (!level) {
                    std::cerr << "--log-level '" << *value << "' is not one of debug, info, warning, error\n";
                    return std::nullopt;
                }
                options.logLevel = *level;
            } else {
                return std::nullopt;
            }
        } else if (arg == "--target") {
            if (auto value = require_value(i, "--target", attached)) {
                options.targetRoot = std::filesystem::path{std::string{*value}};
            } else {
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            if (attached) {
                std::cerr << "--help does not accept a value\n";
                return std::nullopt;
            }
            options.showHelp = true;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            return std::nullopt;
        }
    }
    return options;
}

void ApplyRunOptions(RunConfig& config, RunOptions const& options) {
    if (options.logLevel) {
        config.logLevel = *options.logLevel;
    }
    if (options.targetRoot) {
        config.targetRoot = *options.targetRoot;
    }
}

} // namespace CT::CLI
