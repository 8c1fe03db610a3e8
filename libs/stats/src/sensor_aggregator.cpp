/**
 * @file sensor_aggregator.cpp
 * @brief Merged statistics table implementation.
 * @author Watosn
 */

#include "lpcs/stats/sensor_aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lpcs/core/calendar.hpp"
#include "lpcs/stats/scene_identity.hpp"
#include "lpcs/stats/stat_record.hpp"

namespace lpcs::stats {

std::string normalize_label(const std::string& label) {
  std::string out = label;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return c == ' ' ? '_' : static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string merged_stats_filename(const std::string& label) { return normalize_label(label) + "_stats.csv"; }

AggregationResult aggregate_sensor_stats(const std::string& label, const std::vector<std::filesystem::path>& stat_files,
                                         const std::filesystem::path& output_dir) {
  AggregationResult out{};
  out.csv_file = output_dir / merged_stats_filename(label);
  out.rows.reserve(stat_files.size());

  for (const auto& file : stat_files) {
    spdlog::debug("{}", file.string());
    const auto parsed = parse_stat_record(file);
    if (parsed.status != core::Status::Ok) {
      out.status = parsed.status;
      out.message = parsed.message;
      out.rows.clear();
      return out;
    }

    const SceneIdentity id = resolve_scene(file);
    if (!id.resolved()) {
      spdlog::warn("unrecognized scene name, dating as 0000-00-00: {}", file.filename().string());
    }
    const auto& r = parsed.record;
    std::string row = fmt::format("{},{},{},{},{}", core::iso_date(id.date()), r.minimum_text, r.maximum_text,
                                  r.mean_text, r.stddev_text);
    spdlog::debug("{}", row);
    out.rows.push_back(std::move(row));
  }

  // ISO dates lead every row, so lexicographic order is chronological.
  std::sort(out.rows.begin(), out.rows.end());

  std::ofstream csv(out.csv_file, std::ios::trunc);
  if (!csv) {
    out.status = core::Status::IoError;
    out.message = fmt::format("failed to open output csv: {}", out.csv_file.string());
    return out;
  }
  csv << kMergedStatsHeader;
  for (const auto& row : out.rows) {
    csv << '\n' << row;
  }
  csv.close();
  if (!csv) {
    out.status = core::Status::IoError;
    out.message = fmt::format("failed to write output csv: {}", out.csv_file.string());
    return out;
  }

  spdlog::info("wrote merged stats: {} ({} rows)", out.csv_file.string(), out.rows.size());
  return out;
}

}  // namespace lpcs::stats
