#pragma once
#include "StageRunner.hpp"

#include <filesystem>

namespace CT {

struct ExistenceCheckOptions {
    std::filesystem::path targetRoot;
    // Rows with fewer than three columns are only logged unless this is set,
    // in which case they are recorded as NO_ENTRIES.
    bool routeMalformedRows{false};
};

/**
 * Verifies that every (id, subdir, filename) row names a file under the
 * target root. The first row is a header. Nothing is created or modified.
 */
auto RunExistenceCheck(Csv::CsvReader& input, IO::ErrorSink& sink, ExistenceCheckOptions const& options) -> StageReport;

auto CheckExistenceRow(Csv::Row const& row, IO::ErrorSink& sink, ExistenceCheckOptions const& options) -> RowOutcome;

} // namespace CT
