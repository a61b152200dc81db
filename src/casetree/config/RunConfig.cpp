#include "RunConfig.hpp"

#include "fs/PathDeriver.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <utility>

namespace CT {

namespace {

using json = nlohmann::json;

auto invalid(std::string message) -> Error {
    return Error{Error::Code::InvalidConfiguration, std::move(message)};
}

// Looks up section.key. A missing section or key leaves the default alone;
// a present value of the wrong type is an error.
template <typename T>
auto read_value(json const& doc, std::string_view section, std::string_view key, T& target) -> Expected<void> {
    auto sectionIt = doc.find(std::string{section});
    if (sectionIt == doc.end() || sectionIt->is_null()) {
        return {};
    }
    if (!sectionIt->is_object()) {
        return std::unexpected(invalid(std::string{section} + " must be an object"));
    }
    auto it = sectionIt->find(std::string{key});
    if (it == sectionIt->end() || it->is_null()) {
        return {};
    }
    auto const name = std::string{section} + "." + std::string{key};
    if constexpr (std::is_same_v<T, bool>) {
        if (!it->is_boolean()) {
            return std::unexpected(Error{Error::Code::InvalidType, name + " must be a boolean"});
        }
        target = it->get<bool>();
    } else {
        if (!it->is_string()) {
            return std::unexpected(Error{Error::Code::InvalidType, name + " must be a string"});
        }
        target = T{it->get<std::string>()};
    }
    return {};
}

auto read_path(json const& doc, std::string_view section, std::string_view key, std::filesystem::path& target)
    -> Expected<void> {
    std::string value = target.string();
    if (auto result = read_value(doc, section, key, value); !result) {
        return result;
    }
    if (value.empty()) {
        return std::unexpected(invalid(std::string{section} + "." + std::string{key} + " must not be empty"));
    }
    target = value;
    return {};
}

auto resolve(std::filesystem::path const& path, std::filesystem::path const& base) -> std::filesystem::path {
    if (path.is_absolute()) {
        return path;
    }
    return (base / path).lexically_normal();
}

auto require_existing(std::filesystem::path const& path, std::string_view name, bool directory)
    -> std::optional<std::string> {
    std::error_code ec;
    auto const      status = std::filesystem::status(path, ec);
    if (!std::filesystem::exists(status)) {
        return std::string{"File specified under "} + std::string{name} + " (" + path.string() + ") does not exist";
    }
    if (directory && !std::filesystem::is_directory(status)) {
        return std::string{name} + " (" + path.string() + ") is not a directory";
    }
    if (!directory && std::filesystem::is_directory(status)) {
        return std::string{name} + " (" + path.string() + ") is a directory, expected a CSV file";
    }
    return std::nullopt;
}

} // namespace

auto ParseRunConfig(std::string_view jsonText) -> Expected<RunConfig> {
    json doc;
    try {
        doc = json::parse(jsonText);
    } catch (std::exception const& ex) {
        return std::unexpected(Error{Error::Code::MalformedInput, ex.what()});
    }
    if (!doc.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "config root must be an object"});
    }

    RunConfig config;

    for (auto result : {read_path(doc, "input", "primary_csv", config.primaryCsv),
                        read_path(doc, "input", "nested_csv", config.nestedCsv),
                        read_path(doc, "errors", "primary_csv", config.primaryErrorCsv),
                        read_path(doc, "errors", "nested_csv", config.nestedErrorCsv),
                        read_path(doc, "errors", "check_csv", config.checkErrorCsv),
                        read_path(doc, "target", "path", config.targetRoot),
                        read_path(doc, "sources", "homepage", config.homepageSource),
                        read_path(doc, "sources", "individual_gate", config.individualGateSource),
                        read_path(doc, "log", "file", config.logFile),
                        read_value(doc, "subdirs", "homepage", config.homepageSubdir),
                        read_value(doc, "subdirs", "individual_gate", config.individualGateSubdir),
                        read_value(doc, "check", "route_malformed_rows", config.routeMalformedCheckRows),
                        read_value(doc, "identifiers", "strict", config.strictIdentifiers)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }

    std::string checkCsv;
    if (auto result = read_value(doc, "input", "check_csv", checkCsv); !result) {
        return std::unexpected(result.error());
    }
    if (!checkCsv.empty()) {
        config.checkCsv = std::filesystem::path{checkCsv};
    }

    std::string level{logLevelToString(config.logLevel)};
    if (auto result = read_value(doc, "log", "level", level); !result) {
        return std::unexpected(result.error());
    }
    auto parsedLevel = logLevelFromString(level);
    if (!parsedLevel) {
        return std::unexpected(invalid("log.level '" + level + "' is not one of debug, info, warning, error"));
    }
    config.logLevel = *parsedLevel;

    std::string encoding{Csv::encodingToString(config.checkEncoding)};
    if (auto result = read_value(doc, "check", "encoding", encoding); !result) {
        return std::unexpected(result.error());
    }
    auto parsedEncoding = Csv::encodingFromString(encoding);
    if (!parsedEncoding) {
        return std::unexpected(invalid("check.encoding '" + encoding + "' is not supported"));
    }
    config.checkEncoding = *parsedEncoding;

    return config;
}

auto LoadRunConfig(std::filesystem::path const& file) -> Expected<RunConfig> {
    std::ifstream stream(file);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "The config file " + file.string() + " is missing"});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    auto config = ParseRunConfig(oss.str());
    if (!config) {
        auto error    = config.error();
        error.message = file.string() + ": " + error.message.value_or("invalid config");
        return std::unexpected(std::move(error));
    }
    return config;
}

auto ResolveRunConfigPaths(RunConfig config, std::filesystem::path const& base) -> RunConfig {
    config.primaryCsv           = resolve(config.primaryCsv, base);
    config.nestedCsv            = resolve(config.nestedCsv, base);
    config.primaryErrorCsv      = resolve(config.primaryErrorCsv, base);
    config.nestedErrorCsv       = resolve(config.nestedErrorCsv, base);
    config.checkErrorCsv        = resolve(config.checkErrorCsv, base);
    config.targetRoot           = resolve(config.targetRoot, base);
    config.homepageSource       = resolve(config.homepageSource, base);
    config.individualGateSource = resolve(config.individualGateSource, base);
    config.logFile              = resolve(config.logFile, base);
    if (config.checkCsv) {
        config.checkCsv = resolve(*config.checkCsv, base);
    }
    return config;
}

auto ValidateRunConfig(RunConfig const& config) -> std::optional<std::string> {
    if (auto message = require_existing(config.primaryCsv, "input.primary_csv", false)) {
        return message;
    }
    if (auto message = require_existing(config.nestedCsv, "input.nested_csv", false)) {
        return message;
    }
    if (config.checkCsv) {
        if (auto message = require_existing(*config.checkCsv, "input.check_csv", false)) {
            return message;
        }
    }
    if (auto message = require_existing(config.targetRoot, "target.path", true)) {
        return message;
    }
    for (auto const& [source, name] : {std::pair{&config.homepageSource, "sources.homepage"},
                                       std::pair{&config.individualGateSource, "sources.individual_gate"}}) {
        if (Fs::isSameOrInside(config.targetRoot, *source) || Fs::isSameOrInside(*source, config.targetRoot)) {
            return std::string{name} + " (" + source->string() + ") overlaps target.path (" + config.targetRoot.string()
                   + "); copies would land inside their own source";
        }
    }
    if (auto valid = Fs::validateSegment(config.homepageSubdir); !valid) {
        return "subdirs.homepage: " + valid.error().message.value_or("invalid");
    }
    if (auto valid = Fs::validateSegment(config.individualGateSubdir); !valid) {
        return "subdirs.individual_gate: " + valid.error().message.value_or("invalid");
    }
    if (config.homepageSubdir == config.individualGateSubdir) {
        return std::string{"subdirs.homepage and subdirs.individual_gate must differ"};
    }
    return std::nullopt;
}

} // namespace CT
