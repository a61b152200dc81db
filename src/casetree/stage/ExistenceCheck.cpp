#include "ExistenceCheck.hpp"

#include "fs/PathDeriver.hpp"
#include "log/TaggedLogger.hpp"

#include <system_error>

namespace CT {

auto CheckExistenceRow(Csv::Row const& row, IO::ErrorSink& sink, ExistenceCheckOptions const& options) -> RowOutcome {
    if (row.size() < 3) {
        auto const subject = row.empty() ? std::string_view{} : TrimField(row.front());
        if (options.routeMalformedRows) {
            Emit(sink, subject, RecordKind::NoEntries, "expected id, subdir and filename columns");
        } else {
            ct_log("Skipping malformed check row for '" + std::string{subject} + "': expected 3 columns, found "
                       + std::to_string(row.size()),
                   "WARNING",
                   "ExistenceCheck");
        }
        return RowOutcome::Rejected;
    }

    auto const id       = TrimField(row[0]);
    auto const expected = Fs::derivePath(options.targetRoot, id, {TrimField(row[1])}, TrimField(row[2]));
    std::error_code ec;
    if (std::filesystem::exists(expected, ec)) {
        return RowOutcome::Accepted;
    }
    if (ec) {
        ct_log("Cannot stat " + expected.string() + ": " + ec.message(), "WARNING", "ExistenceCheck");
    }
    Emit(sink, id, RecordKind::ErrorMissingFile, expected.string());
    return RowOutcome::Rejected;
}

auto RunExistenceCheck(Csv::CsvReader& input, IO::ErrorSink& sink, ExistenceCheckOptions const& options) -> StageReport {
    bool headerSkipped = false;
    auto report        = RunStageRows(Stage::Check, input, sink, [&](Csv::Row const& row) {
        if (!headerSkipped) {
            headerSkipped = true;
            return RowOutcome::Accepted;
        }
        return CheckExistenceRow(row, sink, options);
    });
    if (headerSkipped && report.rows > 0) {
        --report.rows;
        --report.accepted;
    }
    return report;
}

} // namespace CT
