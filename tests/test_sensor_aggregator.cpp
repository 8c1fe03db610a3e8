/**
 * @file test_sensor_aggregator.cpp
 * @brief Merged per-sensor CSV tests.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lpcs/stats/sensor_aggregator.hpp"

namespace {

std::filesystem::path write_stats(const std::filesystem::path& dir, const std::string& name, const std::string& min,
                                  const std::string& max, const std::string& mean, const std::string& stddev) {
  const auto path = dir / name;
  std::ofstream out(path);
  out << "MINIMUM=" << min << "\nMAXIMUM=" << max << "\nMEAN=" << mean << "\nSTDDEV=" << stddev << "\n";
  return path;
}

std::string read_all(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

int main() {
  using lpcs::core::Status;
  namespace st = lpcs::stats;

  const auto dir = std::filesystem::temp_directory_path() / "lpcs_test_sensor_aggregator";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);

  if (st::normalize_label("Landsat 5 SR Red") != "landsat_5_sr_red" ||
      st::merged_stats_filename("Terra Emis Band 20") != "terra_emis_band_20_stats.csv") {
    spdlog::error("label normalization mismatch");
    return 1;
  }

  // Listed out of chronological order on purpose.
  const std::vector<std::filesystem::path> files = {
      write_stats(dir, "LT50290302016200EDC00_sr_band3.stats", "30", "3000", "1500.5", "12.25"),
      write_stats(dir, "LT50290302015100EDC00_sr_band3.stats", "10", "1000", "500", "1"),
      write_stats(dir, "LT50290302015300EDC00_sr_band3.stats", "20", "2000", "1000", "2"),
  };

  const auto result = st::aggregate_sensor_stats("Landsat 5 SR Red", files, dir);
  if (result.status != Status::Ok) {
    spdlog::error("aggregation failed: {}", result.message);
    return 2;
  }
  if (result.csv_file != dir / "landsat_5_sr_red_stats.csv" || result.rows.size() != 3) {
    spdlog::error("unexpected output path or row count");
    return 3;
  }

  const std::string expected =
      "DATE,MINIMUM,MAXIMUM,MEAN,STDDEV\n"
      "2015-04-10,10,1000,500,1\n"
      "2015-10-27,20,2000,1000,2\n"
      "2016-07-18,30,3000,1500.5,12.25";
  const std::string actual = read_all(result.csv_file);
  if (actual != expected) {
    spdlog::error("csv content mismatch:\n{}", actual);
    return 4;
  }

  const auto unknown = write_stats(dir, "mystery.stats", "1", "2", "1.5", "0.5");
  const auto undated = st::aggregate_sensor_stats("Mystery", {unknown}, dir);
  if (undated.status != Status::Ok || undated.rows.size() != 1 || !undated.rows.front().starts_with("0000-00-00,")) {
    spdlog::error("unresolved scene should be dated 0000-00-00");
    return 5;
  }

  const auto broken = dir / "LT50290302015101EDC00_sr_band4.stats";
  {
    std::ofstream out(broken);
    out << "MINIMUM=1\nMAXIMUM=2\n";
  }
  const auto failed = st::aggregate_sensor_stats("Landsat 5 SR NIR", {broken}, dir);
  if (failed.status != Status::MissingField || std::filesystem::exists(dir / "landsat_5_sr_nir_stats.csv")) {
    spdlog::error("missing field should fail without writing a csv");
    return 6;
  }

  std::filesystem::remove_all(dir);
  return 0;
}
