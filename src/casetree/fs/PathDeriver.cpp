#include "PathDeriver.hpp"

#include <algorithm>
#include <system_error>
#include <vector>

namespace CT::Fs {

auto derivePath(std::filesystem::path const&           root,
                std::string_view                       id,
                std::initializer_list<std::string_view> segments,
                std::optional<std::string_view>        sub) -> std::filesystem::path {
    auto path = root / std::filesystem::path{id};
    for (auto segment : segments) {
        path /= std::filesystem::path{segment};
    }
    if (sub) {
        path /= std::filesystem::path{*sub};
    }
    return path;
}

auto validateSegment(std::string_view segment) -> Expected<void> {
    if (segment.empty()) {
        return std::unexpected(Error{Error::Code::InvalidPathSubcomponent, "empty identifier"});
    }
    if (segment == "." || segment == "..") {
        return std::unexpected(Error{Error::Code::InvalidPathSubcomponent,
                                     "'" + std::string{segment} + "' refers to a relative directory"});
    }
    if (segment.find_first_of(std::string_view{"/\\\0", 3}) != std::string_view::npos) {
        return std::unexpected(Error{Error::Code::InvalidPathSubcomponent,
                                     "'" + std::string{segment} + "' contains a path separator"});
    }
    return {};
}

namespace {

auto resolved(std::filesystem::path const& path) -> std::filesystem::path {
    std::error_code ec;
    auto            canonical = std::filesystem::weakly_canonical(path, ec);
    if (ec) {
        return std::filesystem::absolute(path, ec).lexically_normal();
    }
    return canonical;
}

auto withoutEmptyTail(std::filesystem::path const& path) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> parts(path.begin(), path.end());
    while (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    return parts;
}

} // namespace

auto isSameOrInside(std::filesystem::path const& inner, std::filesystem::path const& outer) -> bool {
    auto const innerParts = withoutEmptyTail(resolved(inner));
    auto const outerParts = withoutEmptyTail(resolved(outer));
    if (outerParts.size() > innerParts.size()) {
        return false;
    }
    return std::equal(outerParts.begin(), outerParts.end(), innerParts.begin());
}

} // namespace CT::Fs
