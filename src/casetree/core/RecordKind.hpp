#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace CT {

// Reasons a row (or part of a row) lands in a stage's error CSV.
enum class RecordKind {
    DuplicateEntry,
    DuplicateSubId,
    NoEntries,
    EntryMissingFromFirstCsv,
    FileNotExist,
    OsError,
    ErrorMissingFile,
    InvalidIdentifier
};

struct ErrorRecord {
    std::string subject;
    RecordKind  kind;
    std::string detail;

    bool operator==(ErrorRecord const& other) const = default;
};

[[nodiscard]] inline auto recordKindToString(RecordKind kind) -> std::string_view {
    switch (kind) {
    case RecordKind::DuplicateEntry:
        return "DUPLICATE_ENTRY";
    case RecordKind::DuplicateSubId:
        return "DUPLICATE_SUBID";
    case RecordKind::NoEntries:
        return "NO_ENTRIES";
    case RecordKind::EntryMissingFromFirstCsv:
        return "ENTRY_MISSING_FROM_FIRST_CSV";
    case RecordKind::FileNotExist:
        return "FILE_NOT_EXIST";
    case RecordKind::OsError:
        return "OS_ERROR";
    case RecordKind::ErrorMissingFile:
        return "ERROR_MISSING_FILE";
    case RecordKind::InvalidIdentifier:
        return "INVALID_IDENTIFIER";
    }
    return "OS_ERROR";
}

[[nodiscard]] inline auto recordKindFromString(std::string_view text) -> std::optional<RecordKind> {
    for (auto kind : {RecordKind::DuplicateEntry,
                      RecordKind::DuplicateSubId,
                      RecordKind::NoEntries,
                      RecordKind::EntryMissingFromFirstCsv,
                      RecordKind::FileNotExist,
                      RecordKind::OsError,
                      RecordKind::ErrorMissingFile,
                      RecordKind::InvalidIdentifier}) {
        if (recordKindToString(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

} // namespace CT
