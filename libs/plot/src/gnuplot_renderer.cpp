/**
 * @file gnuplot_renderer.cpp
 * @brief Gnuplot chart renderer implementation.
 * @author Watosn
 */

#include "lpcs/plot/gnuplot_renderer.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lpcs/core/calendar.hpp"

namespace lpcs::plot {
namespace {

constexpr int kDefaultPointType = 7;  // filled circle
constexpr double kGnuplotPointScale = 5.0;

std::string quote_for_gnuplot(const std::string& text) {
  std::string out = "'";
  for (const char c : text) {
    if (c == '\'') {
      out += "''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

int point_type_for(const std::string& marker) {
  char* end = nullptr;
  const long v = std::strtol(marker.c_str(), &end, 10);
  if (end != marker.c_str() && *end == '\0' && v > 0) {
    return static_cast<int>(v);
  }
  return kDefaultPointType;
}

}  // namespace

double nice_tick_step(double y_min, double y_max, int max_ticks) {
  const double span = y_max - y_min;
  if (!(span > 0.0) || max_ticks <= 0) {
    return 1.0;
  }
  const double raw = span / static_cast<double>(max_ticks);
  const double magnitude = std::pow(10.0, std::floor(std::log10(raw)));
  constexpr std::array<double, 5> kSteps = {1.0, 2.0, 2.5, 5.0, 10.0};
  for (const double s : kSteps) {
    if (s * magnitude >= raw * (1.0 - 1e-12)) {
      return s * magnitude;
    }
  }
  return 10.0 * magnitude;
}

std::string GnuplotChartRenderer::build_script(const ChartDescription& chart, const std::filesystem::path& image_file) {
  const int width_px = static_cast<int>(std::lround(chart.width_in * chart.dpi));
  const int height_px = static_cast<int>(std::lround(chart.height_in * chart.dpi));
  const int pt = point_type_for(chart.marker);
  const double ps = chart.marker_size / kGnuplotPointScale;

  std::ostringstream script;
  script << fmt::format("set terminal pngcairo size {},{} enhanced\n", width_px, height_px);
  script << "set output " << quote_for_gnuplot(image_file.string()) << "\n";
  script << "set object 1 rect from graph 0,0 to graph 1,1 behind fc rgb " << quote_for_gnuplot(chart.background_color)
         << " fs solid 1.0 noborder\n";
  script << "set xdata time\n";
  script << "set timefmt '%Y-%m-%d'\n";
  script << "set format x '%Y-%m-%d'\n";
  script << "set mxtics\n";
  script << fmt::format("set xrange ['{}':'{}']\n", core::iso_date(chart.axes.x_min), core::iso_date(chart.axes.x_max));
  script << fmt::format("set yrange [{}:{}]\n", chart.axes.y_min, chart.axes.y_max);
  script << fmt::format("set ytics {}\n", nice_tick_step(chart.axes.y_min, chart.axes.y_max, chart.axes.y_max_ticks));
  script << "set xlabel " << quote_for_gnuplot(chart.axes.x_label) << "\n";
  script << "set ylabel " << quote_for_gnuplot(chart.axes.y_label) << "\n";
  script << "set grid ytics mytics lt 1 lc rgb '#c0c0c0'\n";
  script << "set lmargin at screen 0.1\nset rmargin at screen 0.92\nset tmargin at screen 0.9\nset bmargin at screen 0.1\n";
  script << "set key outside top center horizontal maxcols 5 box opaque fc rgb "
         << quote_for_gnuplot(chart.background_color) << " font ',12'\n";

  for (std::size_t i = 0; i < chart.series.size(); ++i) {
    const auto& s = chart.series[i];
    script << "$s" << i << " << EOD\n";
    for (std::size_t k = 0; k < s.dates.size(); ++k) {
      const double lo = k < s.bar_low.size() ? s.bar_low[k] : s.values[k];
      const double hi = k < s.bar_high.size() ? s.bar_high[k] : s.values[k];
      script << fmt::format("{} {} {} {}\n", core::iso_date(s.dates[k]), s.values[k], lo, hi);
    }
    script << "EOD\n";
  }

  script << "plot ";
  bool first = true;
  for (std::size_t i = 0; i < chart.series.size(); ++i) {
    const auto& s = chart.series[i];
    const std::string color = quote_for_gnuplot(s.color);
    if (chart.plot_type == PlotType::Range) {
      script << (first ? "" : ", \\\n     ")
             << fmt::format("$s{} using 1:3:(0):($4-$3) with vectors nohead lc rgb {} lw 1 notitle", i, color);
      first = false;
    }
    script << (first ? "" : ", \\\n     ")
           << fmt::format("$s{} using 1:2 with linespoints lc rgb {} pt {} ps {} title {}", i, color, pt, ps,
                          quote_for_gnuplot(s.label));
    first = false;
  }
  script << "\nunset output\n";
  return script.str();
}

RenderResult GnuplotChartRenderer::render(const ChartDescription& chart, const std::filesystem::path& output_dir) {
  const auto image_file = output_dir / (chart.output_stem + ".png");
  const auto script_file = output_dir / (chart.output_stem + ".gp");
  if (chart.series.empty()) {
    return RenderResult{.status = core::Status::InvalidInput,
                        .message = fmt::format("chart {} has no series", chart.output_stem)};
  }

  {
    std::ofstream out(script_file, std::ios::trunc);
    if (!out) {
      return RenderResult{.status = core::Status::IoError,
                          .message = fmt::format("failed to open gnuplot script: {}", script_file.string())};
    }
    out << build_script(chart, image_file);
  }

  const auto cmd = executor_.run(config_.executable + " " + core::shell_quote(script_file.string()));
  if (!config_.keep_script) {
    std::error_code ec;
    std::filesystem::remove(script_file, ec);
  }
  if (cmd.status != core::Status::Ok) {
    if (!cmd.output.empty()) {
      spdlog::error("{}", cmd.output);
    }
    return RenderResult{.status = cmd.status,
                        .message = fmt::format("gnuplot failed for {}: {}", chart.output_stem, cmd.message)};
  }
  return RenderResult{.image_file = image_file};
}

}  // namespace lpcs::plot
