/**
 * @file orchestrator.cpp
 * @brief Band-type orchestration implementation.
 * @author Watosn
 */

#include "lpcs/pipeline/orchestrator.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fnmatch.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lpcs/plot/plot_builder.hpp"
#include "lpcs/stats/sensor_aggregator.hpp"
#include "lpcs/stats/stat_record.hpp"

namespace lpcs::pipeline {

FileMatchResult find_matching_files(const std::filesystem::path& dir, const std::string& pattern) {
  FileMatchResult out{};
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) {
      continue;
    }
    const std::string name = it->path().filename().string();
    // Hidden files only match patterns that start with a dot.
    if (name.starts_with('.') && !pattern.starts_with('.')) {
      continue;
    }
    if (::fnmatch(pattern.c_str(), name.c_str(), 0) == 0) {
      out.files.push_back(it->path());
    }
  }
  if (ec) {
    return FileMatchResult{.status = core::Status::IoError,
                           .message = fmt::format("failed to list {}: {}", dir.string(), ec.message())};
  }
  std::sort(out.files.begin(), out.files.end());
  return out;
}

BandTypeOutcome Orchestrator::process_band_type(const BandTypeGroup& group) const {
  BandTypeOutcome out{.band_type = group.band_type};
  std::vector<std::filesystem::path> pool;
  std::string single_sensor_name;

  for (const auto& source : group.sources) {
    const auto found = find_matching_files(work_dir_, source.pattern);
    if (found.status != core::Status::Ok) {
      out.status = found.status;
      out.message = found.message;
      return out;
    }
    const auto& files = found.files;
    if (files.empty()) {
      continue;
    }
    ++out.sensor_count;
    single_sensor_name = source.sensor_name;

    const auto merged =
        stats::aggregate_sensor_stats(fmt::format("{} {}", source.sensor_name, group.band_type), files, work_dir_);
    if (merged.status != core::Status::Ok) {
      out.status = merged.status;
      out.message = merged.message;
      return out;
    }
    out.csv_files.push_back(merged.csv_file);
    pool.insert(pool.end(), files.begin(), files.end());
  }

  if (out.sensor_count == 0) {
    spdlog::debug("no statistics found for {}", group.band_type);
    return out;
  }

  out.plot_name = (out.sensor_count > 1) ? fmt::format("Multi Sensor {}", group.band_type)
                                         : fmt::format("{} {}", single_sensor_name, group.band_type);

  std::vector<stats::StatRecord> records;
  records.reserve(pool.size());
  for (const auto& file : pool) {
    spdlog::debug("{}", file.string());
    auto parsed = stats::parse_stat_record(file);
    if (parsed.status != core::Status::Ok) {
      out.status = parsed.status;
      out.message = parsed.message;
      return out;
    }
    records.push_back(std::move(parsed.record));
  }

  const plot::PlotBuilder builder(config_);
  const auto plots = builder.render_all(out.plot_name, group.band_type, records, renderer_, work_dir_);
  if (plots.status != core::Status::Ok) {
    out.status = plots.status;
    out.message = plots.message;
    return out;
  }
  out.images = plots.images;

  for (const auto& file : pool) {
    std::error_code ec;
    if (std::filesystem::exists(file, ec) && !std::filesystem::remove(file, ec)) {
      out.status = core::Status::IoError;
      out.message = fmt::format("failed to remove {}: {}", file.string(), ec.message());
      return out;
    }
    out.consumed_files.push_back(file);
  }
  spdlog::info("processed {} ({} sensors, {} files)", group.band_type, out.sensor_count, pool.size());
  return out;
}

CatalogOutcome Orchestrator::process_catalog(const std::vector<BandTypeGroup>& catalog) const {
  CatalogOutcome out{};
  for (const auto& group : catalog) {
    auto result = process_band_type(group);
    const core::Status status = result.status;
    std::string message = result.message;
    out.band_types.push_back(std::move(result));
    if (status != core::Status::Ok) {
      out.status = status;
      out.message = fmt::format("{}: {}", group.band_type, message);
      return out;
    }
  }
  return out;
}

}  // namespace lpcs::pipeline
