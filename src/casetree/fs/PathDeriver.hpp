#pragma once
#include "core/Error.hpp"

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string_view>

namespace CT::Fs {

// root / id [/ segment...] [/ sub]. Segments are joined as given: nothing is
// normalized, resolved or checked against the filesystem.
[[nodiscard]] auto derivePath(std::filesystem::path const&           root,
                              std::string_view                       id,
                              std::initializer_list<std::string_view> segments = {},
                              std::optional<std::string_view>        sub      = std::nullopt) -> std::filesystem::path;

// Rejects values that would not stay a single child of their parent when
// used as a path segment.
[[nodiscard]] auto validateSegment(std::string_view segment) -> Expected<void>;

// True when inner is outer itself or lies somewhere below it. Both paths are
// resolved with weakly_canonical first, so symlinks and ".." are followed
// for the parts that exist.
[[nodiscard]] auto isSameOrInside(std::filesystem::path const& inner, std::filesystem::path const& outer) -> bool;

} // namespace CT::Fs
