#include "StageRunner.hpp"

#include "fs/CopyEngine.hpp"
#include "fs/DirectoryMaterializer.hpp"
#include "fs/PathDeriver.hpp"
#include "log/TaggedLogger.hpp"

#include <vector>

namespace CT {

auto TrimField(std::string_view field) -> std::string_view {
    auto const first = field.find_first_not_of(" \t");
    if (first == std::string_view::npos) {
        return {};
    }
    auto const last = field.find_last_not_of(" \t");
    return field.substr(first, last - first + 1);
}

void Emit(IO::ErrorSink& sink, std::string_view subject, RecordKind kind, std::string_view detail) {
    if (auto written = sink.record(subject, kind, detail); !written) {
        ct_log("Could not record " + std::string{recordKindToString(kind)} + " for '" + std::string{subject}
                   + "': " + describeError(written.error()),
               "ERROR",
               "ErrorSink");
    }
}

auto RunStageRows(Stage stage,
                  Csv::CsvReader& input,
                  IO::ErrorSink& sink,
                  std::function<RowOutcome(Csv::Row const&)> const& handle) -> StageReport {
    StageReport report;
    report.stage = stage;
    auto const recordsBefore = sink.count();

    ct_log("Handling input CSV " + input.source() + " (" + std::string{stageToString(stage)} + ")", "INFO", "Stage");
    while (true) {
        auto row = input.next();
        if (!row) {
            ct_log("Stopping " + std::string{stageToString(stage)} + ": " + describeError(row.error()), "ERROR", "Stage");
            report.inputComplete = false;
            break;
        }
        if (!row->has_value()) {
            break;
        }
        ++report.rows;
        ct_log("Line " + std::to_string(input.lineNumber()) + " of " + input.source(), "DEBUG", "Stage");
        switch (handle(**row)) {
        case RowOutcome::Accepted:
        case RowOutcome::AcceptedWithErrors:
            ++report.accepted;
            break;
        case RowOutcome::Rejected:
            ++report.rejected;
            break;
        }
    }
    report.records = sink.count() - recordsBefore;
    return report;
}

StageRunner::StageRunner(StageLayout layout)
    : paths(std::move(layout)) {}

auto StageRunner::runPrimary(Csv::CsvReader& input, IO::ErrorSink& sink) -> StageReport {
    return RunStageRows(Stage::Primary, input, sink, [&](Csv::Row const& row) { return this->processPrimaryRow(row, sink); });
}

auto StageRunner::runNested(Csv::CsvReader& input, IO::ErrorSink& sink) -> StageReport {
    auto const claimedBefore = ids.subCount();
    auto report = RunStageRows(Stage::Nested, input, sink, [&](Csv::Row const& row) { return this->processNestedRow(row, sink); });
    report.subIdentifiers = ids.subCount() - claimedBefore;
    return report;
}

auto StageRunner::rejectInvalid(std::string_view value, IO::ErrorSink& sink) -> bool {
    if (value.empty()) {
        Emit(sink, value, RecordKind::InvalidIdentifier, "empty identifier");
        return true;
    }
    if (!paths.strictIdentifiers) {
        return false;
    }
    if (auto valid = Fs::validateSegment(value); !valid) {
        Emit(sink, value, RecordKind::InvalidIdentifier, valid.error().message.value_or("invalid identifier"));
        return true;
    }
    return false;
}

auto StageRunner::scaffold(std::filesystem::path const& dir,
                           bool                         createParents,
                           std::string_view             subject,
                           IO::ErrorSink&               sink) -> bool {
    auto result = Fs::ensureDir(dir, createParents);
    if (!result) {
        Emit(sink, subject, RecordKind::OsError, result.error().message.value_or(dir.string()));
        return false;
    }
    if (*result == Fs::EnsureDirResult::ParentMissing) {
        Emit(sink, subject, RecordKind::OsError, "parent directory missing: " + dir.string());
        return false;
    }
    return true;
}

auto StageRunner::copyInto(std::filesystem::path const& src,
                           std::filesystem::path const& dst,
                           std::string_view             subject,
                           IO::ErrorSink&               sink) -> bool {
    auto const result = Fs::copyTree(src, dst);
    switch (result.status) {
    case Fs::CopyStatus::Copied:
        return true;
    case Fs::CopyStatus::SourceMissing:
        Emit(sink, subject, RecordKind::FileNotExist, src.string());
        return false;
    case Fs::CopyStatus::CopyFailed:
        Emit(sink, subject, RecordKind::OsError, result.detail);
        return false;
    }
    return false;
}

auto StageRunner::processPrimaryRow(Csv::Row const& row, IO::ErrorSink& sink) -> RowOutcome {
    auto const id = TrimField(row.empty() ? std::string_view{} : std::string_view{row.front()});
    if (this->rejectInvalid(id, sink)) {
        return RowOutcome::Rejected;
    }
    if (ids.seen(Stage::Primary, id)) {
        Emit(sink, id, RecordKind::DuplicateEntry, stageToString(Stage::Primary));
        return RowOutcome::Rejected;
    }
    ids.mark(Stage::Primary, id);

    if (!this->scaffold(Fs::derivePath(paths.targetRoot, id), true, id, sink)) {
        return RowOutcome::AcceptedWithErrors;
    }
    auto const homepage   = Fs::derivePath(paths.targetRoot, id, {paths.homepageSubdir});
    auto const gate       = Fs::derivePath(paths.targetRoot, id, {paths.individualGateSubdir});
    bool const homepageOk = this->scaffold(homepage, false, id, sink);
    bool const gateOk     = this->scaffold(gate, false, id, sink);
    if (!homepageOk) {
        return RowOutcome::AcceptedWithErrors;
    }

    bool const copied = this->copyInto(Fs::derivePath(paths.homepageSource, id), homepage, id, sink);
    return (copied && gateOk) ? RowOutcome::Accepted : RowOutcome::AcceptedWithErrors;
}

auto StageRunner::processNestedRow(Csv::Row const& row, IO::ErrorSink& sink) -> RowOutcome {
    auto const id = TrimField(row.empty() ? std::string_view{} : std::string_view{row.front()});
    if (id.empty()) {
        Emit(sink, id, RecordKind::InvalidIdentifier, "empty identifier");
        return RowOutcome::Rejected;
    }
    if (!ids.seen(Stage::Primary, id)) {
        Emit(sink, id, RecordKind::EntryMissingFromFirstCsv, stageToString(Stage::Primary));
        return RowOutcome::Rejected;
    }

    std::vector<std::string_view> subIds;
    for (std::size_t column = 1; column < row.size(); ++column) {
        auto const sub = TrimField(row[column]);
        if (!sub.empty()) {
            subIds.push_back(sub);
        }
    }
    if (subIds.empty()) {
        Emit(sink, id, RecordKind::NoEntries, "row has no sub-identifier column");
        return RowOutcome::Rejected;
    }
    if (ids.seen(Stage::Nested, id)) {
        Emit(sink, id, RecordKind::DuplicateEntry, stageToString(Stage::Nested));
        return RowOutcome::Rejected;
    }
    ids.mark(Stage::Nested, id);

    auto const slot = Fs::derivePath(paths.targetRoot, id, {paths.individualGateSubdir});
    if (!this->scaffold(slot, false, id, sink)) {
        return RowOutcome::AcceptedWithErrors;
    }

    bool clean = true;
    for (auto const sub : subIds) {
        if (this->rejectInvalid(sub, sink)) {
            clean = false;
            continue;
        }
        if (ids.seenSub(sub)) {
            Emit(sink, sub, RecordKind::DuplicateSubId, id);
            clean = false;
            continue;
        }
        ids.markSub(sub);
        auto const destination = Fs::derivePath(paths.targetRoot, id, {paths.individualGateSubdir}, sub);
        if (!this->copyInto(Fs::derivePath(paths.individualGateSource, sub), destination, sub, sink)) {
            clean = false;
        }
    }
    return clean ? RowOutcome::Accepted : RowOutcome::AcceptedWithErrors;
}

} // namespace CT
