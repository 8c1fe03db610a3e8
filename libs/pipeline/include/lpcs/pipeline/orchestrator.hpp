/**
 * @file orchestrator.hpp
 * @brief Per-band-type discovery, aggregation, plotting and input cleanup.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "lpcs/core/types.hpp"
#include "lpcs/pipeline/catalog.hpp"
#include "lpcs/plot/chart.hpp"

namespace lpcs::pipeline {

/**
 * @brief What processing one band type produced.
 */
struct BandTypeOutcome {
  std::string band_type{};
  std::string plot_name{};
  std::size_t sensor_count{};
  std::vector<std::filesystem::path> csv_files{};
  std::vector<std::filesystem::path> images{};
  std::vector<std::filesystem::path> consumed_files{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief What processing a whole catalog produced; stops at the first failure.
 */
struct CatalogOutcome {
  std::vector<BandTypeOutcome> band_types{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Files of one glob search.
 */
struct FileMatchResult {
  std::vector<std::filesystem::path> files{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Regular files of `dir` whose names match a shell glob, sorted by name.
 * @return `IoError` when `dir` is missing or cannot be listed; no match is `Ok` with no files.
 */
[[nodiscard]] FileMatchResult find_matching_files(const std::filesystem::path& dir, const std::string& pattern);

/**
 * @brief Drives the catalog over one working directory.
 *
 * Inputs are read from and outputs written to `work_dir`. Consumed inputs are
 * deleted once a band type has been aggregated and plotted.
 */
class Orchestrator final {
 public:
  Orchestrator(std::filesystem::path work_dir, const plot::RenderConfig& config, plot::IChartRenderer& renderer)
      : work_dir_(std::move(work_dir)), config_(config), renderer_(renderer) {}

  /**
   * @brief Aggregate each contributing sensor, plot the pooled group, delete the inputs.
   * @return Outcome with zero sensors (and no outputs) when nothing matched.
   */
  [[nodiscard]] BandTypeOutcome process_band_type(const BandTypeGroup& group) const;

  /**
   * @brief Process groups in order; the first failing group aborts the rest.
   */
  [[nodiscard]] CatalogOutcome process_catalog(const std::vector<BandTypeGroup>& catalog) const;

 private:
  std::filesystem::path work_dir_{};
  const plot::RenderConfig& config_;
  plot::IChartRenderer& renderer_;
};

}  // namespace lpcs::pipeline
