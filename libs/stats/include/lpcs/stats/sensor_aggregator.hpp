/**
 * @file sensor_aggregator.hpp
 * @brief Merge per-scene statistic files into one date-sorted CSV table.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "lpcs/core/types.hpp"

namespace lpcs::stats {

/**
 * @brief Header line of every merged statistics table.
 */
inline constexpr const char* kMergedStatsHeader = "DATE,MINIMUM,MAXIMUM,MEAN,STDDEV";

/**
 * @brief Output of one aggregation.
 */
struct AggregationResult {
  std::filesystem::path csv_file{};
  std::vector<std::string> rows{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Lowercase and replace spaces with underscores ("Landsat 5 SR Red" -> "landsat_5_sr_red").
 */
[[nodiscard]] std::string normalize_label(const std::string& label);

/**
 * @brief CSV filename for a group label (`<normalized>_stats.csv`).
 */
[[nodiscard]] std::string merged_stats_filename(const std::string& label);

/**
 * @brief Parse every file, build `date,min,max,mean,stddev` rows and write the sorted table.
 * @param label Group label, e.g. "Landsat 5 SR Red".
 * @param stat_files Statistic files of the group in any order.
 * @param output_dir Directory receiving the CSV file.
 * @return Result with the written path and rows; nothing is written on failure.
 */
[[nodiscard]] AggregationResult aggregate_sensor_stats(const std::string& label,
                                                       const std::vector<std::filesystem::path>& stat_files,
                                                       const std::filesystem::path& output_dir);

}  // namespace lpcs::stats
