#include "Pipeline.hpp"

#include "csv/CsvReader.hpp"
#include "io/ErrorSink.hpp"
#include "log/TaggedLogger.hpp"
#include "stage/ExistenceCheck.hpp"

#include <system_error>
#include <utility>

namespace CT {

namespace {

void warnIfMissing(std::filesystem::path const& root, std::string_view name) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        ct_log(std::string{name} + " " + root.string() + " is not a directory; every copy from it will be reported as FILE_NOT_EXIST",
               "WARNING",
               "Pipeline");
    }
}

auto openStage(std::filesystem::path const& input,
               Csv::TextEncoding            encoding,
               std::filesystem::path const& errors,
               Stage                        stage) -> Expected<std::pair<Csv::CsvReader, IO::ErrorSink>> {
    auto sink = IO::ErrorSink::open(errors, std::string{stageToString(stage)});
    if (!sink) {
        return std::unexpected(sink.error());
    }
    auto reader = Csv::CsvReader::open(input, encoding);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    return std::pair<Csv::CsvReader, IO::ErrorSink>{std::move(*reader), std::move(*sink)};
}

} // namespace

auto MakeStageLayout(RunConfig const& config) -> StageLayout {
    StageLayout layout;
    layout.targetRoot           = config.targetRoot;
    layout.homepageSource       = config.homepageSource;
    layout.individualGateSource = config.individualGateSource;
    layout.homepageSubdir       = config.homepageSubdir;
    layout.individualGateSubdir = config.individualGateSubdir;
    layout.strictIdentifiers    = config.strictIdentifiers;
    return layout;
}

auto DescribeReport(StageReport const& report) -> std::string {
    std::string text{stageToString(report.stage)};
    text += ": " + std::to_string(report.rows) + " rows, " + std::to_string(report.accepted) + " accepted, "
            + std::to_string(report.rejected) + " rejected, " + std::to_string(report.records) + " error records";
    if (report.stage == Stage::Nested) {
        text += ", " + std::to_string(report.subIdentifiers) + " sub-identifiers claimed";
    }
    if (!report.inputComplete) {
        text += " (input ended early)";
    }
    return text;
}

auto RunPipeline(RunConfig const& config) -> Expected<RunSummary> {
    warnIfMissing(config.homepageSource, "sources.homepage");
    warnIfMissing(config.individualGateSource, "sources.individual_gate");

    RunSummary  summary;
    StageRunner runner{MakeStageLayout(config)};

    ct_log("Reading main CSV...", "INFO", "Pipeline");
    {
        auto stage = openStage(config.primaryCsv, Csv::TextEncoding::Utf8, config.primaryErrorCsv, Stage::Primary);
        if (!stage) {
            return std::unexpected(stage.error());
        }
        summary.primary = runner.runPrimary(stage->first, stage->second);
    }
    ct_log(DescribeReport(summary.primary), "INFO", "Pipeline");

    ct_log("Reading nested CSV...", "INFO", "Pipeline");
    {
        auto stage = openStage(config.nestedCsv, Csv::TextEncoding::Utf8, config.nestedErrorCsv, Stage::Nested);
        if (!stage) {
            return std::unexpected(stage.error());
        }
        summary.nested = runner.runNested(stage->first, stage->second);
    }
    ct_log(DescribeReport(summary.nested), "INFO", "Pipeline");

    if (config.checkCsv) {
        ct_log("Checking files listed in " + config.checkCsv->string() + "...", "INFO", "Pipeline");
        auto stage = openStage(*config.checkCsv, config.checkEncoding, config.checkErrorCsv, Stage::Check);
        if (!stage) {
            return std::unexpected(stage.error());
        }
        ExistenceCheckOptions options;
        options.targetRoot         = config.targetRoot;
        options.routeMalformedRows = config.routeMalformedCheckRows;
        summary.check              = RunExistenceCheck(stage->first, stage->second, options);
        ct_log(DescribeReport(*summary.check), "INFO", "Pipeline");
    }

    return summary;
}

} // namespace CT
