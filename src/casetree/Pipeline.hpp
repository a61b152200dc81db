#pragma once
#include "config/RunConfig.hpp"
#include "core/Error.hpp"
#include "stage/StageRunner.hpp"

#include <optional>
#include <string>

namespace CT {

struct RunSummary {
    StageReport                primary;
    StageReport                nested;
    std::optional<StageReport> check;
};

[[nodiscard]] auto MakeStageLayout(RunConfig const& config) -> StageLayout;

// Runs the primary stage, then the nested stage, then the existence check
// when a check CSV is configured. Bad rows never fail the run; an input or
// error file that cannot be opened does.
[[nodiscard]] auto RunPipeline(RunConfig const& config) -> Expected<RunSummary>;

[[nodiscard]] auto DescribeReport(StageReport const& report) -> std::string;

} // namespace CT
