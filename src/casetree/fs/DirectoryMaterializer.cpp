#include "DirectoryMaterializer.hpp"

#include "log/TaggedLogger.hpp"

#include <system_error>

namespace CT::Fs {

namespace {

auto makeOsError(std::filesystem::path const& path, std::error_code const& ec) -> Error {
    auto code = ec == std::errc::permission_denied ? Error::Code::InvalidPermissions : Error::Code::IoFailure;
    return Error{code, "cannot create " + path.string() + ": " + ec.message()};
}

} // namespace

auto ensureDirResultToString(EnsureDirResult result) -> std::string_view {
    switch (result) {
    case EnsureDirResult::Created:
        return "created";
    case EnsureDirResult::AlreadyExists:
        return "already_exists";
    case EnsureDirResult::ParentMissing:
        return "parent_missing";
    }
    return "created";
}

auto ensureDir(std::filesystem::path const& path, bool createParents) -> Expected<EnsureDirResult> {
    std::error_code ec;
    auto const      status = std::filesystem::status(path, ec);
    if (std::filesystem::exists(status)) {
        if (!std::filesystem::is_directory(status)) {
            return std::unexpected(Error{Error::Code::InvalidPath, path.string() + " exists and is not a directory"});
        }
        ct_log("Attempted to create " + path.string() + ", but it already exists", "WARNING", "Materializer");
        return EnsureDirResult::AlreadyExists;
    }

    ct_log("Creating path: " + path.string(), "INFO", "Materializer");
    if (createParents) {
        std::filesystem::create_directories(path, ec);
        if (ec) {
            return std::unexpected(makeOsError(path, ec));
        }
        return EnsureDirResult::Created;
    }

    auto const parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
        ct_log("Attempted to create " + path.string() + ", but parent directory doesn't exist", "WARNING", "Materializer");
        return EnsureDirResult::ParentMissing;
    }
    ec.clear();
    bool const created = std::filesystem::create_directory(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return EnsureDirResult::ParentMissing;
        }
        return std::unexpected(makeOsError(path, ec));
    }
    return created ? EnsureDirResult::Created : EnsureDirResult::AlreadyExists;
}

} // namespace CT::Fs
