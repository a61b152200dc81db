#pragma once
#include "core/Error.hpp"
#include "core/RecordKind.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace CT::IO {

/**
 * Append-only CSV of rejected records for one stage. Each line is
 * identifier,error_kind,detail and is flushed as soon as it is written.
 * Opening a sink discards whatever an earlier run left at the same path.
 */
class ErrorSink {
public:
    [[nodiscard]] static auto open(std::filesystem::path const& path, std::string stageName) -> Expected<ErrorSink>;

    ErrorSink(ErrorSink&&) noexcept            = default;
    ErrorSink& operator=(ErrorSink&&) noexcept = default;
    ErrorSink(ErrorSink const&)                = delete;
    ErrorSink& operator=(ErrorSink const&)     = delete;
    ~ErrorSink()                               = default;

    auto record(std::string_view subject, RecordKind kind, std::string_view detail) -> Expected<void>;

    [[nodiscard]] auto count() const -> std::size_t { return written; }
    [[nodiscard]] auto path() const -> std::filesystem::path const& { return filePath; }
    [[nodiscard]] auto stage() const -> std::string const& { return stageName; }

private:
    ErrorSink(std::filesystem::path path, std::string stageName, std::ofstream stream);

    std::filesystem::path filePath;
    std::string           stageName;
    std::ofstream         stream;
    std::size_t           written = 0;
};

} // namespace CT::IO
