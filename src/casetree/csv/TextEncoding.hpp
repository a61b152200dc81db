#pragma once
#include "core/Error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace CT::Csv {

enum class TextEncoding {
    Utf8,
    Windows1252,
    Latin1
};

[[nodiscard]] auto encodingFromString(std::string_view name) -> std::optional<TextEncoding>;
[[nodiscard]] auto encodingToString(TextEncoding encoding) -> std::string_view;

// Converts raw bytes in the given encoding to UTF-8. UTF-8 input is returned
// unchanged apart from a leading byte order mark.
[[nodiscard]] auto decodeToUtf8(std::string_view bytes, TextEncoding encoding) -> Expected<std::string>;

} // namespace CT::Csv
