#pragma once
#include "core/Error.hpp"

#include <filesystem>
#include <string_view>

namespace CT::Fs {

enum class EnsureDirResult {
    Created,
    AlreadyExists,
    ParentMissing
};

[[nodiscard]] auto ensureDirResultToString(EnsureDirResult result) -> std::string_view;

/**
 * Creates a directory. With createParents every missing ancestor is created
 * too; without it a missing parent is reported as ParentMissing and nothing
 * is touched. An existing directory is AlreadyExists, never an error, so
 * repeated calls are safe. Other OS failures (permissions, a regular file in
 * the way) come back as the error.
 */
[[nodiscard]] auto ensureDir(std::filesystem::path const& path, bool createParents) -> Expected<EnsureDirResult>;

} // namespace CT::Fs
