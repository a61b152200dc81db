#pragma once
#include "core/Error.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <set>
#include <source_location>
#include <string>
#include <string_view>

namespace CT {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

[[nodiscard]] auto logLevelToString(LogLevel level) -> std::string_view;
[[nodiscard]] auto logLevelFromString(std::string_view text) -> std::optional<LogLevel>;

// Lines carry their severity as one of the tags ("DEBUG", "INFO", "WARNING",
// "ERROR"). A line without a severity tag is treated as INFO.
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setLoggingEnabled(bool enabled) -> void;
    auto setMinimumLevel(LogLevel level) -> void;
    [[nodiscard]] auto minimumLevel() const -> LogLevel;
    auto setSkipTags(std::set<std::string> tags) -> void;

    // Appends to the file; stderr output continues alongside it.
    [[nodiscard]] auto openLogFile(std::filesystem::path const& path) -> Expected<void>;
    auto closeLogFile() -> void;

    static std::mutex coutMutex;

private:
    std::atomic<bool>     loggingEnabled;
    std::atomic<LogLevel> minLevel;
    std::set<std::string> skipTags;
    std::ofstream         fileSink;
    mutable std::mutex    sinkMutex;

    auto        write(const LogMessage& msg) -> void;
    auto        format(const LogMessage& msg) const -> std::string;
    static auto levelOf(const std::set<std::string>& tags) -> LogLevel;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!loggingEnabled)
        return;

    auto logMessage = LogMessage{.timestamp = std::chrono::system_clock::now(), .tags = {std::string(std::forward<Tags>(tags))...}, .message = message, .location = location};
    this->write(logMessage);
}

#define ct_log(message, ...) ::CT::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_logging_enabled(bool enabled);
void set_log_level(LogLevel level);

} // namespace CT
