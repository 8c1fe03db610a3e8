/**
 * @file test_orchestrator.cpp
 * @brief Band-type discovery, aggregation, plotting and cleanup tests.
 * @author Watosn
 */

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "lpcs/core/calendar.hpp"
#include "lpcs/pipeline/catalog.hpp"
#include "lpcs/pipeline/orchestrator.hpp"

namespace {

using lpcs::core::Status;

class TouchingRenderer final : public lpcs::plot::IChartRenderer {
 public:
  lpcs::plot::RenderResult render(const lpcs::plot::ChartDescription& chart,
                                  const std::filesystem::path& output_dir) override {
    charts.push_back(chart);
    const auto image = output_dir / (chart.output_stem + ".png");
    std::ofstream(image) << "png";
    return lpcs::plot::RenderResult{.image_file = image};
  }

  std::vector<lpcs::plot::ChartDescription> charts{};
};

void write_stats(const std::filesystem::path& dir, const std::string& name, const std::string& body) {
  std::ofstream out(dir / name);
  out << body;
}

std::string read_all(const std::filesystem::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

const lpcs::pipeline::BandTypeGroup* find_group(const std::string& band_type) {
  for (const auto& group : lpcs::pipeline::standard_catalog()) {
    if (group.band_type == band_type) {
      return &group;
    }
  }
  return nullptr;
}

std::filesystem::path fresh_dir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace

int main() {
  namespace pl = lpcs::pipeline;
  const lpcs::plot::RenderConfig config{};

  const auto* ndvi = find_group("NDVI");
  const auto* sr_blue = find_group("SR Blue");
  if (ndvi == nullptr || sr_blue == nullptr || pl::standard_catalog().size() != 29) {
    spdlog::error("standard catalog is missing groups");
    return 1;
  }

  {
    const auto dir = fresh_dir("lpcs_test_orchestrator_empty");
    TouchingRenderer renderer;
    const pl::Orchestrator orchestrator(dir, config, renderer);
    const auto outcome = orchestrator.process_band_type(*ndvi);
    if (outcome.status != Status::Ok || outcome.sensor_count != 0 || !renderer.charts.empty() ||
        !std::filesystem::is_empty(dir)) {
      spdlog::error("empty band type should produce nothing");
      return 2;
    }
    std::filesystem::remove_all(dir);
  }

  {
    const auto dir = fresh_dir("lpcs_test_orchestrator_glob");
    write_stats(dir, "LT50290302015100EDC00_sr_ndvi.stats", "");
    write_stats(dir, "LT50290302015100EDC00_sr_nbr2.stats", "");
    write_stats(dir, ".LT50290302015101EDC00_sr_ndvi.stats", "");
    const auto found = pl::find_matching_files(dir, "LT5*_sr_ndvi.stats");
    const auto none = pl::find_matching_files(dir, "LT5*_sr_nbr.stats");
    if (found.status != Status::Ok || found.files.size() != 1 ||
        found.files[0].filename() != "LT50290302015100EDC00_sr_ndvi.stats" || none.status != Status::Ok ||
        !none.files.empty()) {
      spdlog::error("glob matching mismatch");
      return 3;
    }
    std::filesystem::remove_all(dir);
  }

  {
    const auto missing = std::filesystem::temp_directory_path() / "lpcs_test_orchestrator_missing";
    std::filesystem::remove_all(missing);
    if (pl::find_matching_files(missing, "LT5*_sr_ndvi.stats").status != Status::IoError) {
      spdlog::error("listing a missing directory should be IoError");
      return 14;
    }
    TouchingRenderer renderer;
    const pl::Orchestrator orchestrator(missing, config, renderer);
    const auto outcome = orchestrator.process_catalog(pl::standard_catalog());
    if (outcome.status != Status::IoError || outcome.band_types.size() != 1 || !renderer.charts.empty()) {
      spdlog::error("missing work directory should abort the catalog with IoError");
      return 15;
    }
  }

  {
    const auto dir = fresh_dir("lpcs_test_orchestrator_single");
    write_stats(dir, "LT50290302016200EDC00_sr_ndvi.stats", "MINIMUM=300\nMAXIMUM=9000\nMEAN=6000\nSTDDEV=50\n");
    write_stats(dir, "LT50290302015100EDC00_sr_ndvi.stats", "MINIMUM=-100\nMAXIMUM=8000\nMEAN=4000\nSTDDEV=40\n");
    write_stats(dir, "LT50290302015300EDC00_sr_ndvi.stats", "MINIMUM=200\nMAXIMUM=7000\nMEAN=3000\nSTDDEV=30\n");
    write_stats(dir, "LT50290302015300EDC00_sr_evi.stats", "MINIMUM=1\nMAXIMUM=2\nMEAN=1\nSTDDEV=0\n");

    TouchingRenderer renderer;
    const pl::Orchestrator orchestrator(dir, config, renderer);
    const auto outcome = orchestrator.process_band_type(*ndvi);
    if (outcome.status != Status::Ok) {
      spdlog::error("single sensor run failed: {}", outcome.message);
      return 4;
    }
    if (outcome.sensor_count != 1 || outcome.plot_name != "Landsat 5 NDVI" || outcome.csv_files.size() != 1 ||
        outcome.csv_files[0] != dir / "landsat_5_ndvi_stats.csv" || outcome.images.size() != 5 ||
        outcome.consumed_files.size() != 3) {
      spdlog::error("single sensor outcome mismatch");
      return 5;
    }

    const std::string csv = read_all(outcome.csv_files[0]);
    if (csv != "DATE,MINIMUM,MAXIMUM,MEAN,STDDEV\n2015-04-10,-100,8000,4000,40\n2015-10-27,200,7000,3000,30\n"
               "2016-07-18,300,9000,6000,50") {
      spdlog::error("merged csv mismatch:\n{}", csv);
      return 6;
    }

    // 465 day span -> two passes of five days per end.
    const auto& range = renderer.charts.front();
    const int first = lpcs::core::days_from_civil(lpcs::core::CivilDate{.year = 2015, .month = 4, .day = 10});
    const int last = lpcs::core::days_from_civil(lpcs::core::CivilDate{.year = 2016, .month = 7, .day = 18});
    if (range.output_stem != "landsat_5_ndvi_minimum_maximum_mean_plot" ||
        first - lpcs::core::days_from_civil(range.axes.x_min) != 10 ||
        lpcs::core::days_from_civil(range.axes.x_max) - last != 10) {
      spdlog::error("range chart extents mismatch");
      return 7;
    }

    for (const auto& file : outcome.consumed_files) {
      if (std::filesystem::exists(file)) {
        spdlog::error("consumed input still present: {}", file.string());
        return 8;
      }
    }
    for (const auto& image : outcome.images) {
      if (!std::filesystem::exists(image)) {
        spdlog::error("missing image: {}", image.string());
        return 9;
      }
    }
    if (!std::filesystem::exists(dir / "LT50290302015300EDC00_sr_evi.stats")) {
      spdlog::error("other band types must not be consumed");
      return 10;
    }
    std::filesystem::remove_all(dir);
  }

  {
    const auto dir = fresh_dir("lpcs_test_orchestrator_multi");
    write_stats(dir, "LT50290302015100EDC00_sr_ndvi.stats", "MINIMUM=0\nMAXIMUM=8000\nMEAN=4000\nSTDDEV=40\n");
    write_stats(dir, "MOD13Q1.A2016033.h10v04.006_NDVI.stats", "MINIMUM=0\nMAXIMUM=9000\nMEAN=5000\nSTDDEV=60\n");

    TouchingRenderer renderer;
    const pl::Orchestrator orchestrator(dir, config, renderer);
    const auto outcome = orchestrator.process_band_type(*ndvi);
    if (outcome.status != Status::Ok || outcome.sensor_count != 2 || outcome.plot_name != "Multi Sensor NDVI" ||
        outcome.csv_files.size() != 2 || !std::filesystem::exists(dir / "landsat_5_ndvi_stats.csv") ||
        !std::filesystem::exists(dir / "terra_ndvi_stats.csv")) {
      spdlog::error("multi sensor outcome mismatch");
      return 11;
    }
    const auto& range = renderer.charts.front();
    if (range.output_stem != "multi_sensor_ndvi_minimum_maximum_mean_plot" || range.series.size() != 2 ||
        range.legend[0] != "LT5" || range.legend[1] != "Terra") {
      spdlog::error("multi sensor chart mismatch");
      return 12;
    }
    std::filesystem::remove_all(dir);
  }

  {
    const auto dir = fresh_dir("lpcs_test_orchestrator_abort");
    write_stats(dir, "LT50290302015100EDC00_sr_band1.stats", "MINIMUM=1\nMAXIMUM=2\nMEAN=1.5\n");
    write_stats(dir, "LT50290302015100EDC00_sr_ndvi.stats", "MINIMUM=0\nMAXIMUM=8000\nMEAN=4000\nSTDDEV=40\n");

    TouchingRenderer renderer;
    const pl::Orchestrator orchestrator(dir, config, renderer);
    const auto outcome = orchestrator.process_catalog(pl::standard_catalog());
    if (outcome.status != Status::MissingField || outcome.band_types.size() != 1 ||
        outcome.band_types[0].band_type != "SR Blue" || !renderer.charts.empty() ||
        !std::filesystem::exists(dir / "LT50290302015100EDC00_sr_band1.stats") ||
        !std::filesystem::exists(dir / "LT50290302015100EDC00_sr_ndvi.stats")) {
      spdlog::error("first failing band type should abort the catalog and keep inputs");
      return 13;
    }
    std::filesystem::remove_all(dir);
  }

  return 0;
}
