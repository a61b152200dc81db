#include <doctest/doctest.h>
#include "Pipeline.hpp"
#include "CaseTreeTestHelper.hpp"

using namespace CT;
using CT::Testing::TempDir;

namespace {

struct PipelineFixture {
    PipelineFixture()
        : dir("pipeline") {
        std::filesystem::create_directories(dir.path / "output");
        config = ResolveRunConfigPaths(RunConfig{}, dir.path);
    }

    void write(std::string const& relative, std::string_view contents) { Testing::writeFile(dir.path / relative, contents); }

    auto errors(std::string const& relative) const -> std::vector<ErrorRecord> {
        return Testing::readErrorRecords(dir.path / relative);
    }

    TempDir   dir;
    RunConfig config;
};

} // namespace

TEST_SUITE("pipeline") {

TEST_CASE("full run builds the tree and one error file per stage") {
    PipelineFixture fx;
    fx.write("source/homepage/A/index.html", "home A");
    fx.write("source/homepage/B/index.html", "home B");
    fx.write("source/individual_gate/s1/gate.txt", "gate s1");
    fx.write("source/individual_gate/s2/gate.txt", "gate s2");
    fx.write("main.csv", "A\nB\nA\n");
    fx.write("nested.csv", "A,s1\nB,s1,s2\nX,s3\n");
    fx.write("check.csv", "id,subdir,filename\nA,Homepage,index.html\nB,Homepage,report.pdf\n");
    fx.config.checkCsv = fx.dir.path / "check.csv";

    auto summary = RunPipeline(fx.config);
    REQUIRE(summary.has_value());
    CHECK(summary->primary.accepted == 2);
    CHECK(summary->primary.records == 1);
    CHECK(summary->nested.rows == 3);
    CHECK(summary->nested.records == 2);
    REQUIRE(summary->check.has_value());
    CHECK(summary->check->rows == 2);
    CHECK(summary->check->records == 1);

    auto out = fx.dir.path / "output";
    CHECK(Testing::readFile(out / "A" / "Homepage" / "index.html") == "home A");
    CHECK(Testing::readFile(out / "A" / "Individual Gate" / "s1" / "gate.txt") == "gate s1");
    CHECK(Testing::readFile(out / "B" / "Individual Gate" / "s2" / "gate.txt") == "gate s2");
    CHECK_FALSE(std::filesystem::exists(out / "B" / "Individual Gate" / "s1"));
    CHECK_FALSE(std::filesystem::exists(out / "X"));

    CHECK(fx.errors("errors/main_errors.csv") == std::vector<ErrorRecord>{{"A", RecordKind::DuplicateEntry, "first CSV"}});
    CHECK(fx.errors("errors/nested_errors.csv")
          == std::vector<ErrorRecord>{{"s1", RecordKind::DuplicateSubId, "B"},
                                      {"X", RecordKind::EntryMissingFromFirstCsv, "first CSV"}});
    CHECK(fx.errors("errors/check_errors.csv")
          == std::vector<ErrorRecord>{{"B", RecordKind::ErrorMissingFile, (out / "B" / "Homepage" / "report.pdf").string()}});
}

TEST_CASE("without a check csv the check stage does not run") {
    PipelineFixture fx;
    fx.write("main.csv", "A\n");
    fx.write("nested.csv", "");

    auto summary = RunPipeline(fx.config);
    REQUIRE(summary.has_value());
    CHECK_FALSE(summary->check.has_value());
    CHECK_FALSE(std::filesystem::exists(fx.dir.path / "errors" / "check_errors.csv"));
    CHECK(std::filesystem::exists(fx.dir.path / "errors" / "nested_errors.csv"));

    auto primaryErrors = fx.errors("errors/main_errors.csv");
    REQUIRE(primaryErrors.size() == 1);
    CHECK(primaryErrors[0].kind == RecordKind::FileNotExist);
}

TEST_CASE("a second run replaces the error files") {
    PipelineFixture fx;
    fx.write("source/homepage/A/index.html", "home A");
    fx.write("main.csv", "A\nA\nA\n");
    fx.write("nested.csv", "Q,s1\n");

    REQUIRE(RunPipeline(fx.config).has_value());
    CHECK(fx.errors("errors/main_errors.csv").size() == 2);
    CHECK(fx.errors("errors/nested_errors.csv").size() == 1);

    fx.write("main.csv", "A\n");
    fx.write("nested.csv", "");
    auto second = RunPipeline(fx.config);
    REQUIRE(second.has_value());
    CHECK(second->primary.accepted == 1);
    CHECK(fx.errors("errors/main_errors.csv").empty());
    CHECK(fx.errors("errors/nested_errors.csv").empty());
    CHECK(Testing::readFile(fx.dir.path / "output" / "A" / "Homepage" / "index.html") == "home A");
}

TEST_CASE("missing input fails the run") {
    PipelineFixture fx;
    fx.write("main.csv", "A\n");

    auto summary = RunPipeline(fx.config);
    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code == Error::Code::NotFound);
    CHECK(std::filesystem::is_directory(fx.dir.path / "output" / "A"));
}

TEST_CASE("malformed check encoding stops only the check stage") {
    PipelineFixture fx;
    fx.write("main.csv", "A\n");
    fx.write("nested.csv", "");
    fx.write("check.csv", "id,subdir,filename\nA,Homepage,\x81.pdf\n");
    fx.config.checkCsv = fx.dir.path / "check.csv";

    auto summary = RunPipeline(fx.config);
    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code == Error::Code::MalformedInput);
    CHECK(std::filesystem::exists(fx.dir.path / "errors" / "main_errors.csv"));
}

TEST_CASE("stage layout mirrors the config") {
    RunConfig config;
    config.homepageSubdir    = "Web";
    config.strictIdentifiers = false;
    auto layout              = MakeStageLayout(config);
    CHECK(layout.targetRoot == config.targetRoot);
    CHECK(layout.homepageSource == config.homepageSource);
    CHECK(layout.individualGateSource == config.individualGateSource);
    CHECK(layout.homepageSubdir == "Web");
    CHECK(layout.individualGateSubdir == "Individual Gate");
    CHECK_FALSE(layout.strictIdentifiers);
}

TEST_CASE("report description") {
    StageReport report;
    report.stage    = Stage::Nested;
    report.rows     = 3;
    report.accepted = 2;
    report.rejected = 1;
    report.records  = 1;
    report.subIdentifiers = 4;
    CHECK(DescribeReport(report) == "second CSV: 3 rows, 2 accepted, 1 rejected, 1 error records, 4 sub-identifiers claimed");
    report.stage = Stage::Primary;
    CHECK(DescribeReport(report) == "first CSV: 3 rows, 2 accepted, 1 rejected, 1 error records");
    report.stage = Stage::Nested;
    report.inputComplete = false;
    CHECK(DescribeReport(report).ends_with("(input ended early)"));
}

} // TEST_SUITE
