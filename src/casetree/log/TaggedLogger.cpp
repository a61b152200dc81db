#include "TaggedLogger.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace CT {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

std::mutex TaggedLogger::coutMutex;

auto logLevelToString(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

auto logLevelFromString(std::string_view text) -> std::optional<LogLevel> {
    std::string normalized;
    normalized.reserve(text.size());
    for (unsigned char ch : text) {
        normalized.push_back(static_cast<char>(std::toupper(ch)));
    }
    if (normalized == "WARN") {
        return LogLevel::Warning;
    }
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error}) {
        if (logLevelToString(level) == normalized) {
            return level;
        }
    }
    return std::nullopt;
}

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : loggingEnabled(true), minLevel(LogLevel::Info) {
}

TaggedLogger::~TaggedLogger() {
    this->closeLogFile();
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setMinimumLevel(LogLevel level) -> void {
    minLevel.store(level, std::memory_order_relaxed);
}

auto TaggedLogger::minimumLevel() const -> LogLevel {
    return minLevel.load(std::memory_order_relaxed);
}

auto TaggedLogger::setSkipTags(std::set<std::string> tags) -> void {
    std::lock_guard<std::mutex> lock(sinkMutex);
    skipTags = std::move(tags);
}

auto TaggedLogger::openLogFile(std::filesystem::path const& path) -> Expected<void> {
    std::lock_guard<std::mutex> lock(sinkMutex);
    if (fileSink.is_open()) {
        fileSink.close();
    }
    if (auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return std::unexpected(Error{Error::Code::IoFailure, "cannot create log directory " + parent.string() + ": " + ec.message()});
        }
    }
    fileSink.open(path, std::ios::out | std::ios::app);
    if (!fileSink.is_open()) {
        return std::unexpected(Error{Error::Code::IoFailure, "cannot open log file " + path.string()});
    }
    return {};
}

auto TaggedLogger::closeLogFile() -> void {
    std::lock_guard<std::mutex> lock(sinkMutex);
    if (fileSink.is_open()) {
        fileSink.flush();
        fileSink.close();
    }
}

auto TaggedLogger::levelOf(const std::set<std::string>& tags) -> LogLevel {
    auto level    = LogLevel::Info;
    bool assigned = false;
    for (auto const& tag : tags) {
        auto parsed = logLevelFromString(tag);
        if (!parsed)
            continue;
        if (!assigned || *parsed > level) {
            level    = *parsed;
            assigned = true;
        }
    }
    return level;
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::format(const LogMessage& msg) const -> std::string {
    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm     nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    if (msg.tags.empty()) {
        oss << '[' << logLevelToString(LogLevel::Info) << ']' << ' ';
    } else {
        oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';
    }

    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';
    return oss.str();
}

auto TaggedLogger::write(const LogMessage& msg) -> void {
    if (levelOf(msg.tags) < this->minimumLevel())
        return;

    std::lock_guard<std::mutex> sinkLock(sinkMutex);
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return;

    auto const line = this->format(msg);
    {
        std::lock_guard<std::mutex> lock(coutMutex);
        std::cerr << line << std::flush;
    }
    if (fileSink.is_open()) {
        fileSink << line << std::flush;
    }
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

void set_log_level(LogLevel level) {
    logger().setMinimumLevel(level);
}

} // namespace CT
