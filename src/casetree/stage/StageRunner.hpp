#pragma once
#include "core/RecordKind.hpp"
#include "csv/CsvReader.hpp"
#include "io/ErrorSink.hpp"
#include "registry/IdentifierRegistry.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace CT {

// Where accepted rows land and where their copies come from.
struct StageLayout {
    std::filesystem::path targetRoot;
    std::filesystem::path homepageSource;
    std::filesystem::path individualGateSource;
    std::string           homepageSubdir{"Homepage"};
    std::string           individualGateSubdir{"Individual Gate"};
    bool                  strictIdentifiers{true};
};

struct StageReport {
    Stage       stage{Stage::Primary};
    std::size_t rows{0};
    std::size_t accepted{0};
    std::size_t rejected{0};
    std::size_t records{0};
    // Sub-identifiers claimed run-wide while the nested stage ran.
    std::size_t subIdentifiers{0};
    bool        inputComplete{true};
};

enum class RowOutcome {
    Accepted,
    AcceptedWithErrors,
    Rejected
};

/**
 * Runs the primary and nested stages. Rows are handled one at a time in
 * file order; every rejected row or failed copy becomes a record in the
 * stage's error sink and processing moves on to the next row.
 *
 * The registry is owned here so the nested stage can check its identifiers
 * against the ones the primary stage accepted.
 */
class StageRunner {
public:
    explicit StageRunner(StageLayout layout);

    auto runPrimary(Csv::CsvReader& input, IO::ErrorSink& sink) -> StageReport;
    auto runNested(Csv::CsvReader& input, IO::ErrorSink& sink) -> StageReport;

    auto processPrimaryRow(Csv::Row const& row, IO::ErrorSink& sink) -> RowOutcome;
    auto processNestedRow(Csv::Row const& row, IO::ErrorSink& sink) -> RowOutcome;

    [[nodiscard]] auto registry() const -> IdentifierRegistry const& { return ids; }
    [[nodiscard]] auto layout() const -> StageLayout const& { return paths; }

private:
    auto copyInto(std::filesystem::path const& src,
                  std::filesystem::path const& dst,
                  std::string_view             subject,
                  IO::ErrorSink&               sink) -> bool;
    auto scaffold(std::filesystem::path const& dir, bool createParents, std::string_view subject, IO::ErrorSink& sink)
        -> bool;
    auto rejectInvalid(std::string_view value, IO::ErrorSink& sink) -> bool;

    StageLayout        paths;
    IdentifierRegistry ids;
};

// Reads every row of input and hands it to handle. A malformed input stops
// the stage early with inputComplete cleared.
auto RunStageRows(Stage stage,
                  Csv::CsvReader& input,
                  IO::ErrorSink& sink,
                  std::function<RowOutcome(Csv::Row const&)> const& handle) -> StageReport;

// Records one entry, logging instead of failing when the sink cannot be written.
void Emit(IO::ErrorSink& sink, std::string_view subject, RecordKind kind, std::string_view detail);

[[nodiscard]] auto TrimField(std::string_view field) -> std::string_view;

} // namespace CT
