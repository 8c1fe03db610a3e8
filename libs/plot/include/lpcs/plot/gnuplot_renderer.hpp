/**
 * @file gnuplot_renderer.hpp
 * @brief Chart renderer that drives an external gnuplot process.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "lpcs/core/interfaces.hpp"
#include "lpcs/plot/chart.hpp"

namespace lpcs::plot {

/**
 * @brief Y tick spacing of the form {1, 2, 2.5, 5} x 10^k giving at most `max_ticks` intervals.
 */
[[nodiscard]] double nice_tick_step(double y_min, double y_max, int max_ticks);

/**
 * @brief Writes a pngcairo gnuplot script per chart and runs it through a command executor.
 */
class GnuplotChartRenderer final : public IChartRenderer {
 public:
  /**
   * @brief Renderer configuration.
   */
  struct Config {
    std::string executable{"gnuplot"};
    bool keep_script{false};
  };

  GnuplotChartRenderer(const core::ICommandExecutor& executor, Config config)
      : executor_(executor), config_(std::move(config)) {}

  /**
   * @brief Build the gnuplot script text for a chart written to `image_file`.
   */
  [[nodiscard]] static std::string build_script(const ChartDescription& chart, const std::filesystem::path& image_file);

  /**
   * @brief Render `<output_dir>/<stem>.png`; the script file is removed afterwards unless kept.
   */
  [[nodiscard]] RenderResult render(const ChartDescription& chart, const std::filesystem::path& output_dir) override;

 private:
  const core::ICommandExecutor& executor_;
  Config config_{};
};

}  // namespace lpcs::plot
