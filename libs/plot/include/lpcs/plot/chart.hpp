/**
 * @file chart.hpp
 * @brief Renderer-neutral chart description and renderer interface.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "lpcs/core/types.hpp"

namespace lpcs::plot {

/**
 * @brief Run-wide styling, fixed once at startup and passed by const reference.
 */
struct RenderConfig {
  std::map<core::SensorId, std::string> sensor_colors{
      {core::SensorId::Terra, "#664400"},  // brown
      {core::SensorId::Aqua, "#00cccc"},   // cyan
      {core::SensorId::LT4, "#cc3333"},    // red
      {core::SensorId::LT5, "#0066cc"},    // blue
      {core::SensorId::LE7, "#00cc33"},    // green
  };
  std::string background_color{"#f3f3f3"};
  // numsides,style,angle
  std::string marker{"1,3,0"};
  double marker_size{5.0};
  std::string fallback_color{"#000000"};

  [[nodiscard]] const std::string& color_for(core::SensorId sensor) const {
    const auto it = sensor_colors.find(sensor);
    return it == sensor_colors.end() ? fallback_color : it->second;
  }
};

/**
 * @brief Kind of chart: min-max bars with a mean trend, or a single statistic.
 */
enum class PlotType : unsigned char { Range, Value };

/**
 * @brief One per-sensor series on shared axes.
 *
 * `bar_low`/`bar_high` are filled for range plots only (vertical min-max bars).
 */
struct ChartSeries {
  core::SensorId sensor{core::SensorId::Unknown};
  std::string label{};
  std::string color{};
  std::vector<core::CivilDate> dates{};
  std::vector<double> values{};
  std::vector<double> bar_low{};
  std::vector<double> bar_high{};
};

/**
 * @brief Axis extents and tick policy.
 */
struct ChartAxes {
  core::CivilDate x_min{};
  core::CivilDate x_max{};
  double y_min{};
  double y_max{};
  int y_max_ticks{};
  std::string x_label{"Date"};
  std::string y_label{};
};

/**
 * @brief Everything a renderer needs to draw one chart.
 */
struct ChartDescription {
  std::string output_stem{};
  PlotType plot_type{PlotType::Value};
  std::vector<ChartSeries> series{};
  ChartAxes axes{};
  std::vector<std::string> legend{};
  std::string background_color{};
  std::string marker{};
  double marker_size{};
  double width_in{11.0};
  double height_in{8.5};
  int dpi{100};
};

/**
 * @brief Outcome of rendering one chart.
 */
struct RenderResult {
  std::filesystem::path image_file{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Interface for turning a chart description into an image artifact.
 */
class IChartRenderer {
 public:
  virtual ~IChartRenderer() = default;
  /**
   * @brief Render one chart into `output_dir`.
   * @note Implementations release all drawing resources before returning.
   */
  [[nodiscard]] virtual RenderResult render(const ChartDescription& chart, const std::filesystem::path& output_dir) = 0;
};

}  // namespace lpcs::plot
