#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace CT::Fs {

enum class CopyStatus {
    Copied,
    SourceMissing,
    CopyFailed
};

[[nodiscard]] auto copyStatusToString(CopyStatus status) -> std::string_view;

struct CopyResult {
    CopyStatus  status = CopyStatus::Copied;
    std::string detail;

    [[nodiscard]] auto ok() const -> bool { return status == CopyStatus::Copied; }
};

// Recursively copies the directory src into dst. An existing dst is merged
// into and files already present are overwritten. A src that does not exist
// is SourceMissing and leaves dst alone. A dst inside src is refused as
// CopyFailed before anything is written; every other failure is CopyFailed
// with the OS message in detail. Never throws.
[[nodiscard]] auto copyTree(std::filesystem::path const& src, std::filesystem::path const& dst) -> CopyResult;

} // namespace CT::Fs
