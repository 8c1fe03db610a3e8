/**
 * @file run.hpp
 * @brief One statistics plotting run: stage inputs, process the catalog, publish outputs.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "lpcs/core/types.hpp"
#include "lpcs/pipeline/catalog.hpp"
#include "lpcs/pipeline/orchestrator.hpp"
#include "lpcs/plot/chart.hpp"
#include "lpcs/transfer/remote_stager.hpp"

namespace lpcs::pipeline {

/**
 * @brief Where the order lives and how the local working area is handled.
 */
struct RunOptions {
  std::string order_directory{};
  std::filesystem::path work_directory{"lpcs_statistics"};
  bool keep{false};
};

/**
 * @brief Outcome of a run.
 */
struct RunResult {
  CatalogOutcome catalog{};
  std::vector<std::filesystem::path> published{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Remote directory holding the order's statistic files (`<order>/stats`).
 */
[[nodiscard]] std::string remote_stats_directory(const RunOptions& options);

/**
 * @brief Remote directory receiving the outputs (`<order>/<work directory name>`).
 */
[[nodiscard]] std::string remote_output_directory(const RunOptions& options);

/**
 * @brief Fetch, process `catalog` in the working area, publish, then clean up unless `keep`.
 *
 * Cleanup also happens when any step fails.
 */
[[nodiscard]] RunResult run_statistics(const RunOptions& options, const std::vector<BandTypeGroup>& catalog,
                                       const plot::RenderConfig& config, transfer::IRemoteFileStager& stager,
                                       plot::IChartRenderer& renderer);

}  // namespace lpcs::pipeline
