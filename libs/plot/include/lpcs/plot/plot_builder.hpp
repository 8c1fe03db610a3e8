/**
 * @file plot_builder.hpp
 * @brief Per-sensor time series, scaling and axis extents for trend charts.
 * @author Watosn
 */
#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "lpcs/core/types.hpp"
#include "lpcs/plot/band_ranges.hpp"
#include "lpcs/plot/chart.hpp"
#include "lpcs/stats/stat_record.hpp"

namespace lpcs::plot {

/**
 * @brief What a chart shows; `Range` is min-max bars plus the mean trend.
 */
enum class PlotSubject : unsigned char { Minimum, Maximum, Mean, StdDev, Range };

/**
 * @brief The five charts produced for every band-type group, in output order.
 */
inline constexpr std::array<PlotSubject, 5> kStandardPlotSubjects = {
    PlotSubject::Range, PlotSubject::Minimum, PlotSubject::Maximum, PlotSubject::Mean, PlotSubject::StdDev};

/**
 * @brief Display names of a subject ({"Minimum", "Maximum", "Mean"} for Range).
 */
[[nodiscard]] std::vector<std::string> subject_names(PlotSubject subject);

/**
 * @brief Parse a "Range"/"Value" tag.
 * @return `InvalidInput` for any other text.
 */
[[nodiscard]] core::Status parse_plot_type(const std::string& text, PlotType& out);

/**
 * @brief One dated observation of a sensor.
 */
struct SensorSample {
  core::CivilDate date{};
  double minimum{};
  double maximum{};
  double mean{};
  double stddev{};
};

/**
 * @brief Date-sorted samples per sensor plus the observed date extents.
 */
struct SensorTimeSeries {
  std::map<core::SensorId, std::vector<SensorSample>> samples{};
  std::vector<core::SensorId> sensors{};  // first-encounter order
  core::CivilDate min_date{};
  core::CivilDate max_date{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Group records by sensor and sort each sensor by date.
 * @return `InvalidInput` for an empty record set or an unresolvable scene name.
 */
[[nodiscard]] SensorTimeSeries build_sensor_time_series(const std::vector<stats::StatRecord>& records);

/**
 * @brief Padded X extents: 5 days per end for each of floor(span/365)+1 passes.
 */
void pad_date_extents(core::CivilDate& min_date, core::CivilDate& max_date);

/**
 * @brief Chart label "<plot_name> - <subject> <subject>...".
 */
[[nodiscard]] std::string plot_label(const std::string& plot_name, const std::vector<std::string>& subjects);

/**
 * @brief Output stem of a chart label: "- " removed, lowercased, spaces to underscores, "_plot" appended.
 */
[[nodiscard]] std::string plot_output_stem(const std::string& label);

/**
 * @brief Result of building one chart description.
 */
struct ChartBuildResult {
  ChartDescription chart{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Result of rendering the standard chart set for one group.
 */
struct PlotSetResult {
  std::vector<std::filesystem::path> images{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Builds chart descriptions for one band type from parsed stat records.
 */
class PlotBuilder final {
 public:
  explicit PlotBuilder(const RenderConfig& config,
                       const BandTypeRangeRegistry& ranges = BandTypeRangeRegistry::standard())
      : config_(config), ranges_(ranges) {}

  /**
   * @brief Build a chart from subject names and a plot type.
   * @param plot_name Group label, e.g. "Multi Sensor NDVI".
   * @param subjects Subject names; a Value plot charts the first one.
   * @param band_type Catalog band-type label used for the range lookup.
   * @param records Parsed records of every contributing file.
   * @param plot_type Range or Value.
   */
  [[nodiscard]] ChartBuildResult build(const std::string& plot_name, const std::vector<std::string>& subjects,
                                       const std::string& band_type, const std::vector<stats::StatRecord>& records,
                                       PlotType plot_type) const;

  /**
   * @brief Build a chart for one subject of the standard set.
   */
  [[nodiscard]] ChartBuildResult build(const std::string& plot_name, PlotSubject subject, const std::string& band_type,
                                       const std::vector<stats::StatRecord>& records) const;

  /**
   * @brief Build and render every subject in `kStandardPlotSubjects`.
   */
  [[nodiscard]] PlotSetResult render_all(const std::string& plot_name, const std::string& band_type,
                                         const std::vector<stats::StatRecord>& records, IChartRenderer& renderer,
                                         const std::filesystem::path& output_dir) const;

 private:
  const RenderConfig& config_;
  const BandTypeRangeRegistry& ranges_;
};

}  // namespace lpcs::plot
