#include "CopyEngine.hpp"

#include "PathDeriver.hpp"
#include "log/TaggedLogger.hpp"

#include <exception>
#include <system_error>

namespace CT::Fs {

auto copyStatusToString(CopyStatus status) -> std::string_view {
    switch (status) {
    case CopyStatus::Copied:
        return "copied";
    case CopyStatus::SourceMissing:
        return "source_missing";
    case CopyStatus::CopyFailed:
        return "copy_failed";
    }
    return "copy_failed";
}

auto copyTree(std::filesystem::path const& src, std::filesystem::path const& dst) -> CopyResult {
    namespace fs = std::filesystem;
    try {
        std::error_code ec;
        auto const      sourceStatus = fs::status(src, ec);
        if (!fs::exists(sourceStatus)) {
            if (fs::status_known(sourceStatus) || !ec) {
                ct_log("Source " + src.string() + " does not exist", "WARNING", "CopyEngine");
                return CopyResult{CopyStatus::SourceMissing, src.string()};
            }
            return CopyResult{CopyStatus::CopyFailed, "cannot stat " + src.string() + ": " + ec.message()};
        }
        if (!fs::is_directory(sourceStatus)) {
            return CopyResult{CopyStatus::CopyFailed, src.string() + " is not a directory"};
        }

        if (isSameOrInside(dst, src)) {
            return CopyResult{CopyStatus::CopyFailed, "cannot copy " + src.string() + " into itself (" + dst.string() + ")"};
        }

        ct_log("Copying " + src.string() + " to " + dst.string(), "INFO", "CopyEngine");
        ec.clear();
        fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
        if (ec) {
            ct_log("Copy of " + src.string() + " failed: " + ec.message(), "ERROR", "CopyEngine");
            return CopyResult{CopyStatus::CopyFailed, "copying " + src.string() + " to " + dst.string() + ": " + ec.message()};
        }
        return CopyResult{CopyStatus::Copied, dst.string()};
    } catch (std::exception const& ex) {
        ct_log("Copy of " + src.string() + " failed: " + ex.what(), "ERROR", "CopyEngine");
        return CopyResult{CopyStatus::CopyFailed, ex.what()};
    }
}

} // namespace CT::Fs
