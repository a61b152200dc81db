#pragma once
#include "TextEncoding.hpp"
#include "core/Error.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace CT::Csv {

using Row = std::vector<std::string>;

// Comma separated rows with RFC 4180 quoting. Quoted fields may contain
// separators, doubled quotes and line breaks. Empty lines do not produce rows.
class CsvReader {
public:
    [[nodiscard]] static auto open(std::filesystem::path const& path,
                                   TextEncoding encoding = TextEncoding::Utf8) -> Expected<CsvReader>;
    [[nodiscard]] static auto fromText(std::string text) -> CsvReader;

    // Returns std::nullopt once the input is exhausted.
    [[nodiscard]] auto next() -> Expected<std::optional<Row>>;

    // 1-based line on which the most recently returned row started.
    [[nodiscard]] auto lineNumber() const -> std::size_t { return rowLine; }
    [[nodiscard]] auto source() const -> std::string const& { return sourceName; }

private:
    CsvReader(std::string text, std::string sourceName);

    std::string text;
    std::string sourceName;
    std::size_t position = 0;
    std::size_t line     = 1;
    std::size_t rowLine  = 0;
};

} // namespace CT::Csv
