/**
 * @file main.cpp
 * @brief lpcs statistics plotting command-line entrypoint.
 * @author Watosn
 */

#include <cstdlib>
#include <map>
#include <string>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lpcs/pipeline/catalog.hpp"
#include "lpcs/pipeline/orchestrator.hpp"
#include "lpcs/pipeline/run.hpp"
#include "lpcs/plot/gnuplot_renderer.hpp"
#include "lpcs/transfer/command_executor.hpp"
#include "lpcs/transfer/remote_stager.hpp"

namespace {

struct CliArgs {
  std::string source_host{"localhost"};
  std::string order_directory{};
  std::string stats_directory{"."};
  std::string gnuplot{"gnuplot"};
  bool keep{false};
  bool debug{false};
  bool local{false};
  lpcs::plot::RenderConfig render{};
};

void print_usage() {
  spdlog::error(
      "usage: lpcs_plot_cli --order_directory <dir> [--source_host host] [--stats_directory dir] [--local] [--keep] "
      "[--debug]");
  spdlog::error(
      "       [--terra_color c] [--aqua_color c] [--lt4_color c] [--lt5_color c] [--le7_color c] [--bg_color c] "
      "[--marker m] [--marker_size s] [--gnuplot exe]");
}

bool parse_args(int argc, char** argv, CliArgs& args) {
  using lpcs::core::SensorId;
  const std::map<std::string, SensorId> color_flags = {{"--terra_color", SensorId::Terra},
                                                        {"--aqua_color", SensorId::Aqua},
                                                        {"--lt4_color", SensorId::LT4},
                                                        {"--lt5_color", SensorId::LT5},
                                                        {"--le7_color", SensorId::LE7}};

  for (int i = 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (flag == "--keep") {
      args.keep = true;
      continue;
    }
    if (flag == "--debug") {
      args.debug = true;
      continue;
    }
    if (flag == "--local") {
      args.local = true;
      continue;
    }
    if (i + 1 >= argc) {
      spdlog::error("missing value for {}", flag);
      return false;
    }
    const std::string value = argv[++i];
    if (const auto it = color_flags.find(flag); it != color_flags.end()) {
      args.render.sensor_colors[it->second] = value;
    } else if (flag == "--source_host") {
      args.source_host = value;
    } else if (flag == "--order_directory") {
      args.order_directory = value;
    } else if (flag == "--stats_directory") {
      args.stats_directory = value;
    } else if (flag == "--bg_color") {
      args.render.background_color = value;
    } else if (flag == "--marker") {
      args.render.marker = value;
    } else if (flag == "--marker_size") {
      char* end = nullptr;
      args.render.marker_size = std::strtod(value.c_str(), &end);
      if (end == value.c_str() || *end != '\0' || !(args.render.marker_size > 0.0)) {
        spdlog::error("invalid marker size: {}", value);
        return false;
      }
    } else if (flag == "--gnuplot") {
      args.gnuplot = value;
    } else {
      spdlog::error("unknown option: {}", flag);
      return false;
    }
  }

  if (!args.local && args.order_directory.empty()) {
    spdlog::error("--order_directory is required unless --local is given");
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  CliArgs args{};
  if (!parse_args(argc, argv, args)) {
    print_usage();
    return 1;
  }

  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e %P %-8l -- %v");
  spdlog::set_level(args.debug ? spdlog::level::debug : spdlog::level::info);

  // Styling is fixed from here on and shared read-only by every component.
  const lpcs::plot::RenderConfig& config = args.render;
  const lpcs::transfer::PosixCommandExecutor executor{};
  lpcs::plot::GnuplotChartRenderer renderer(executor, {.executable = args.gnuplot, .keep_script = args.keep});

  if (args.local) {
    const lpcs::pipeline::Orchestrator orchestrator(args.stats_directory, config, renderer);
    const auto outcome = orchestrator.process_catalog(lpcs::pipeline::standard_catalog());
    if (outcome.status != lpcs::core::Status::Ok) {
      spdlog::error("Processing failed [{}]: {}", lpcs::core::status_name(outcome.status), outcome.message);
      return 2;
    }
    spdlog::info("Plot Processing Complete");
    return 0;
  }

  lpcs::transfer::ScpRemoteFileStager stager(executor, {.host = args.source_host});
  const lpcs::pipeline::RunOptions options{.order_directory = args.order_directory, .keep = args.keep};
  const auto result =
      lpcs::pipeline::run_statistics(options, lpcs::pipeline::standard_catalog(), config, stager, renderer);
  if (result.status != lpcs::core::Status::Ok) {
    spdlog::error("Processing failed");
    return 2;
  }

  std::size_t plotted = 0;
  for (const auto& band : result.catalog.band_types) {
    if (band.sensor_count > 0) {
      ++plotted;
    }
  }
  fmt::print("band_types={} plotted={} published={}\n", result.catalog.band_types.size(), plotted,
             result.published.size());
  return 0;
}
