#pragma once
#include <span>
#include <string>
#include <string_view>

namespace CT::Csv {

// Quotes a field when it contains a separator, a quote or a line break.
[[nodiscard]] auto formatField(std::string_view field) -> std::string;

// One CSV line terminated by "\r\n", matching what spreadsheet tools emit.
[[nodiscard]] auto formatRow(std::span<std::string_view const> fields) -> std::string;

} // namespace CT::Csv
