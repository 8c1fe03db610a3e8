/**
 * @file stat_record.hpp
 * @brief Parser for per-scene `key=value` statistic files.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "lpcs/core/types.hpp"

namespace lpcs::stats {

/**
 * @brief One trimmed, lowercased line split on its first `=`.
 *
 * `has_value` is false for lines without `=`; such fields never enter a key table.
 */
struct StatField {
  std::string key{};
  std::string value{};
  bool has_value{};
};

/**
 * @brief Result of reading the raw fields of one statistic file.
 */
struct StatFieldsResult {
  std::vector<StatField> fields{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Statistics for one scene and one band type.
 */
struct StatRecord {
  std::filesystem::path source_file{};
  double minimum{};
  double maximum{};
  double mean{};
  double stddev{};
  // Lowercased text as read, reproduced verbatim in merged CSV rows.
  std::string minimum_text{};
  std::string maximum_text{};
  std::string mean_text{};
  std::string stddev_text{};
};

/**
 * @brief Result of parsing one statistic file into a record.
 */
struct StatRecordResult {
  StatRecord record{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Split one raw line; empty after trimming yields an empty key without value.
 */
[[nodiscard]] StatField split_stat_line(const std::string& line);

/**
 * @brief Read every non-empty line of a statistic file.
 */
[[nodiscard]] StatFieldsResult read_stat_fields(const std::filesystem::path& path);

/**
 * @brief Case-insensitive key table built from well-formed fields (last key wins).
 */
[[nodiscard]] std::map<std::string, std::string> to_key_table(const std::vector<StatField>& fields);

/**
 * @brief Parse a statistic file; `minimum`, `maximum`, `mean` and `stddev` are required.
 * @return `InvalidInput` when any non-empty line lacks `=`.
 */
[[nodiscard]] StatRecordResult parse_stat_record(const std::filesystem::path& path);

}  // namespace lpcs::stats
