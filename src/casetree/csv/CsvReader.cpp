#include "CsvReader.hpp"

#include <fstream>
#include <sstream>

namespace CT::Csv {

CsvReader::CsvReader(std::string text, std::string sourceName)
    : text(std::move(text)), sourceName(std::move(sourceName)) {}

auto CsvReader::open(std::filesystem::path const& path, TextEncoding encoding) -> Expected<CsvReader> {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return std::unexpected(Error{Error::Code::NotFound, "cannot open " + path.string()});
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    if (!stream.good() && !stream.eof()) {
        return std::unexpected(Error{Error::Code::IoFailure, "failed to read " + path.string()});
    }
    auto decoded = decodeToUtf8(oss.str(), encoding);
    if (!decoded) {
        auto error = decoded.error();
        error.message = path.string() + ": " + error.message.value_or("decode failed");
        return std::unexpected(std::move(error));
    }
    return CsvReader{std::move(*decoded), path.string()};
}

auto CsvReader::fromText(std::string text) -> CsvReader {
    return CsvReader{std::move(text), "<memory>"};
}

auto CsvReader::next() -> Expected<std::optional<Row>> {
    auto const size = text.size();

    auto consumeLineEnd = [&] {
        if (text[position] == '\r' && position + 1 < size && text[position + 1] == '\n') {
            ++position;
        }
        ++position;
        ++line;
    };

    while (position < size && (text[position] == '\n' || text[position] == '\r')) {
        consumeLineEnd();
    }
    if (position >= size) {
        return std::optional<Row>{};
    }

    rowLine = line;
    Row         row;
    std::string field;
    bool        inQuotes    = false;
    bool        fieldQuoted = false;

    while (position < size) {
        char const c = text[position];
        if (inQuotes) {
            if (c == '"') {
                if (position + 1 < size && text[position + 1] == '"') {
                    field.push_back('"');
                    position += 2;
                    continue;
                }
                inQuotes = false;
                ++position;
                continue;
            }
            if (c == '\n') {
                ++line;
            }
            field.push_back(c);
            ++position;
            continue;
        }

        if (c == '"' && field.empty() && !fieldQuoted) {
            inQuotes    = true;
            fieldQuoted = true;
            ++position;
            continue;
        }
        if (c == ',') {
            row.push_back(std::move(field));
            field.clear();
            fieldQuoted = false;
            ++position;
            continue;
        }
        if (c == '\r' || c == '\n') {
            consumeLineEnd();
            row.push_back(std::move(field));
            return std::optional<Row>{std::move(row)};
        }
        field.push_back(c);
        ++position;
    }

    if (inQuotes) {
        return std::unexpected(Error{Error::Code::MalformedInput,
                                     sourceName + ": unterminated quoted field starting on line " + std::to_string(rowLine)});
    }
    row.push_back(std::move(field));
    return std::optional<Row>{std::move(row)};
}

} // namespace CT::Csv
