#include "CsvWriter.hpp"

namespace CT::Csv {

auto formatField(std::string_view field) -> std::string {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }
    std::string quoted;
    quoted.reserve(field.size() + 2);
    quoted.push_back('"');
    for (char c : field) {
        if (c == '"') {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

auto formatRow(std::span<std::string_view const> fields) -> std::string {
    std::string line;
    bool        first = true;
    for (auto const& field : fields) {
        if (!first) {
            line.push_back(',');
        }
        line += formatField(field);
        first = false;
    }
    line += "\r\n";
    return line;
}

} // namespace CT::Csv
