/**
 * @file stat_record.cpp
 * @brief Statistic file parser implementation.
 * @author Watosn
 */

#include "lpcs/stats/stat_record.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <utility>

#include <fmt/format.h>

namespace lpcs::stats {
namespace {

std::string trim_lower(const std::string& text) {
  std::size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
    ++start;
  }
  std::size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  std::string out = text.substr(start, end - start);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

}  // namespace

StatField split_stat_line(const std::string& line) {
  const std::string normalized = trim_lower(line);
  const auto eq = normalized.find('=');
  if (eq == std::string::npos) {
    return StatField{.key = normalized, .value = {}, .has_value = false};
  }
  return StatField{.key = trim_lower(normalized.substr(0, eq)),
                   .value = trim_lower(normalized.substr(eq + 1)),
                   .has_value = true};
}

StatFieldsResult read_stat_fields(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    return StatFieldsResult{.status = core::Status::IoError,
                            .message = fmt::format("failed to open stat file: {}", path.string())};
  }

  StatFieldsResult out{};
  std::string line;
  while (std::getline(in, line)) {
    StatField field = split_stat_line(line);
    if (field.key.empty() && !field.has_value) {
      continue;
    }
    out.fields.push_back(std::move(field));
  }
  return out;
}

std::map<std::string, std::string> to_key_table(const std::vector<StatField>& fields) {
  std::map<std::string, std::string> table;
  for (const auto& f : fields) {
    if (f.has_value) {
      table[f.key] = f.value;
    }
  }
  return table;
}

StatRecordResult parse_stat_record(const std::filesystem::path& path) {
  const auto raw = read_stat_fields(path);
  if (raw.status != core::Status::Ok) {
    return StatRecordResult{.status = raw.status, .message = raw.message};
  }
  for (const auto& f : raw.fields) {
    if (!f.has_value) {
      return StatRecordResult{.status = core::Status::InvalidInput,
                              .message = fmt::format("malformed line '{}' in {}", f.key, path.string())};
    }
  }
  const auto table = to_key_table(raw.fields);

  StatRecord record{.source_file = path};
  const std::array<std::pair<const char*, std::pair<double*, std::string*>>, 4> required = {{
      {"minimum", {&record.minimum, &record.minimum_text}},
      {"maximum", {&record.maximum, &record.maximum_text}},
      {"mean", {&record.mean, &record.mean_text}},
      {"stddev", {&record.stddev, &record.stddev_text}},
  }};
  for (const auto& [key, target] : required) {
    const auto it = table.find(key);
    if (it == table.end()) {
      return StatRecordResult{.status = core::Status::MissingField,
                              .message = fmt::format("missing '{}' in {}", key, path.string())};
    }
    if (!parse_double(it->second, *target.first)) {
      return StatRecordResult{.status = core::Status::InvalidInput,
                              .message = fmt::format("non-numeric '{}' value '{}' in {}", key, it->second, path.string())};
    }
    *target.second = it->second;
  }
  return StatRecordResult{.record = std::move(record)};
}

}  // namespace lpcs::stats
