/**
 * @file run.cpp
 * @brief Statistics plotting run implementation.
 * @author Watosn
 */

#include "lpcs/pipeline/run.hpp"

#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace lpcs::pipeline {
namespace {

RunResult execute(const RunOptions& options, const std::vector<BandTypeGroup>& catalog, const plot::RenderConfig& config,
                  transfer::IRemoteFileStager& stager, plot::IChartRenderer& renderer) {
  RunResult out{};
  const auto fetched = stager.fetch(remote_stats_directory(options), options.work_directory);
  if (fetched.status != core::Status::Ok) {
    out.status = fetched.status;
    out.message = fetched.message;
    return out;
  }

  const Orchestrator orchestrator(options.work_directory, config, renderer);
  out.catalog = orchestrator.process_catalog(catalog);
  if (out.catalog.status != core::Status::Ok) {
    out.status = out.catalog.status;
    out.message = out.catalog.message;
    return out;
  }

  const auto published = stager.publish(options.work_directory, remote_output_directory(options));
  out.published = published.files;
  if (published.status != core::Status::Ok) {
    out.status = published.status;
    out.message = published.message;
  }
  return out;
}

}  // namespace

std::string remote_stats_directory(const RunOptions& options) {
  return (std::filesystem::path(options.order_directory) / "stats").string();
}

std::string remote_output_directory(const RunOptions& options) {
  return (std::filesystem::path(options.order_directory) / options.work_directory.filename()).string();
}

RunResult run_statistics(const RunOptions& options, const std::vector<BandTypeGroup>& catalog,
                         const plot::RenderConfig& config, transfer::IRemoteFileStager& stager,
                         plot::IChartRenderer& renderer) {
  RunResult out = execute(options, catalog, config, stager, renderer);

  if (!options.keep) {
    std::error_code ec;
    std::filesystem::remove_all(options.work_directory, ec);
    if (ec) {
      spdlog::warn("failed to remove {}: {}", options.work_directory.string(), ec.message());
    }
  }

  if (out.status == core::Status::Ok) {
    spdlog::info("Plot Processing Complete");
  } else {
    spdlog::error("run failed [{}]: {}", core::status_name(out.status), out.message);
  }
  return out;
}

}  // namespace lpcs::pipeline
