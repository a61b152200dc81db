#include "TextEncoding.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>

namespace CT::Csv {

namespace {

constexpr std::string_view Utf8Bom = "\xEF\xBB\xBF";

// Code points for 0x80-0x9F in Windows-1252; zero marks an unassigned byte.
constexpr std::array<std::uint16_t, 32> Windows1252High = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000,
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0178};

void appendUtf8(std::string& out, std::uint32_t codePoint) {
    if (codePoint < 0x80) {
        out.push_back(static_cast<char>(codePoint));
    } else if (codePoint < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (codePoint >> 6)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (codePoint >> 12)));
        out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
    }
}

auto normalizeName(std::string_view name) -> std::string {
    std::string normalized;
    normalized.reserve(name.size());
    for (unsigned char ch : name) {
        if (ch == '_' || ch == ' ') {
            normalized.push_back('-');
        } else {
            normalized.push_back(static_cast<char>(std::tolower(ch)));
        }
    }
    return normalized;
}

} // namespace

auto encodingFromString(std::string_view name) -> std::optional<TextEncoding> {
    auto const normalized = normalizeName(name);
    if (normalized == "utf-8" || normalized == "utf8") {
        return TextEncoding::Utf8;
    }
    if (normalized == "windows-1252" || normalized == "cp1252") {
        return TextEncoding::Windows1252;
    }
    if (normalized == "latin-1" || normalized == "latin1" || normalized == "iso-8859-1") {
        return TextEncoding::Latin1;
    }
    return std::nullopt;
}

auto encodingToString(TextEncoding encoding) -> std::string_view {
    switch (encoding) {
    case TextEncoding::Utf8:
        return "utf-8";
    case TextEncoding::Windows1252:
        return "windows-1252";
    case TextEncoding::Latin1:
        return "latin-1";
    }
    return "utf-8";
}

auto decodeToUtf8(std::string_view bytes, TextEncoding encoding) -> Expected<std::string> {
    if (encoding == TextEncoding::Utf8) {
        if (bytes.starts_with(Utf8Bom)) {
            bytes.remove_prefix(Utf8Bom.size());
        }
        return std::string{bytes};
    }

    std::string out;
    out.reserve(bytes.size() + bytes.size() / 8);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        auto const byte = static_cast<unsigned char>(bytes[i]);
        if (byte < 0x80) {
            out.push_back(static_cast<char>(byte));
            continue;
        }
        std::uint32_t codePoint = byte;
        if (encoding == TextEncoding::Windows1252 && byte < 0xA0) {
            codePoint = Windows1252High[byte - 0x80];
            if (codePoint == 0) {
                return std::unexpected(Error{Error::Code::MalformedInput,
                                             "byte " + std::to_string(byte) + " at offset " + std::to_string(i)
                                                 + " is not valid windows-1252"});
            }
        }
        appendUtf8(out, codePoint);
    }
    return out;
}

} // namespace CT::Csv
