/**
 * @file plot_builder.cpp
 * @brief Trend chart construction implementation.
 * @author Watosn
 */

#include "lpcs/plot/plot_builder.hpp"

#include <algorithm>
#include <cctype>
#include <tuple>
#include <utility>

#include <Eigen/Dense>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "lpcs/core/calendar.hpp"
#include "lpcs/plot/data_scaler.hpp"
#include "lpcs/stats/scene_identity.hpp"

namespace lpcs::plot {
namespace {

constexpr double kDisplayPadding = 0.025;
constexpr int kDaysPerPaddingPass = 365;
constexpr int kPaddingDaysPerPass = 5;

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

enum class Statistic : unsigned char { Minimum, Maximum, Mean, StdDev };

bool statistic_from_name(const std::string& name, Statistic& out) {
  const std::string lower = to_lower(name);
  if (lower == "minimum") {
    out = Statistic::Minimum;
  } else if (lower == "maximum") {
    out = Statistic::Maximum;
  } else if (lower == "mean") {
    out = Statistic::Mean;
  } else if (lower == "stddev") {
    out = Statistic::StdDev;
  } else {
    return false;
  }
  return true;
}

Eigen::ArrayXd column(const std::vector<SensorSample>& samples, double SensorSample::*field) {
  Eigen::ArrayXd out(static_cast<Eigen::Index>(samples.size()));
  for (std::size_t i = 0; i < samples.size(); ++i) {
    out(static_cast<Eigen::Index>(i)) = samples[i].*field;
  }
  return out;
}

std::vector<double> to_vector(const Eigen::ArrayXd& values) {
  return std::vector<double>(values.data(), values.data() + values.size());
}

}  // namespace

std::vector<std::string> subject_names(PlotSubject subject) {
  switch (subject) {
    case PlotSubject::Minimum:
      return {"Minimum"};
    case PlotSubject::Maximum:
      return {"Maximum"};
    case PlotSubject::Mean:
      return {"Mean"};
    case PlotSubject::StdDev:
      return {"StdDev"};
    case PlotSubject::Range:
      return {"Minimum", "Maximum", "Mean"};
  }
  return {};
}

core::Status parse_plot_type(const std::string& text, PlotType& out) {
  if (text == "Range") {
    out = PlotType::Range;
    return core::Status::Ok;
  }
  if (text == "Value") {
    out = PlotType::Value;
    return core::Status::Ok;
  }
  return core::Status::InvalidInput;
}

SensorTimeSeries build_sensor_time_series(const std::vector<stats::StatRecord>& records) {
  SensorTimeSeries out{};
  if (records.empty()) {
    out.status = core::Status::InvalidInput;
    out.message = "no stat records to plot";
    return out;
  }

  bool first = true;
  for (const auto& record : records) {
    spdlog::debug("{}", record.source_file.string());
    const auto id = stats::resolve_scene(record.source_file);
    if (!id.resolved()) {
      out.status = core::Status::InvalidInput;
      out.message = fmt::format("cannot date scene from filename: {}", record.source_file.filename().string());
      return out;
    }
    const core::CivilDate date = id.date();

    auto& sensor_samples = out.samples[id.sensor];
    if (sensor_samples.empty()) {
      out.sensors.push_back(id.sensor);
    }
    sensor_samples.push_back(SensorSample{
        .date = date, .minimum = record.minimum, .maximum = record.maximum, .mean = record.mean, .stddev = record.stddev});

    if (first || date < out.min_date) {
      out.min_date = date;
    }
    if (first || date > out.max_date) {
      out.max_date = date;
    }
    first = false;
  }

  // Date is the primary key; the statistics only break ties.
  for (auto& [sensor, samples] : out.samples) {
    std::sort(samples.begin(), samples.end(), [](const SensorSample& a, const SensorSample& b) {
      return std::tie(a.date.year, a.date.month, a.date.day, a.minimum, a.maximum, a.mean, a.stddev) <
             std::tie(b.date.year, b.date.month, b.date.day, b.minimum, b.maximum, b.mean, b.stddev);
    });
  }
  return out;
}

void pad_date_extents(core::CivilDate& min_date, core::CivilDate& max_date) {
  const int span_days = core::days_from_civil(max_date) - core::days_from_civil(min_date);
  spdlog::debug("{}", span_days);
  const int passes = span_days / kDaysPerPaddingPass + 1;
  for (int pass = 0; pass < passes; ++pass) {
    min_date = core::add_days(min_date, -kPaddingDaysPerPass);
    max_date = core::add_days(max_date, kPaddingDaysPerPass);
  }
  spdlog::debug("{}", core::iso_date(min_date));
  spdlog::debug("{}", core::iso_date(max_date));
}

std::string plot_label(const std::string& plot_name, const std::vector<std::string>& subjects) {
  std::string label = plot_name + " -";
  for (const auto& s : subjects) {
    label += ' ';
    label += s;
  }
  return label;
}

std::string plot_output_stem(const std::string& label) {
  std::string stem;
  stem.reserve(label.size() + 5);
  for (std::size_t i = 0; i < label.size(); ++i) {
    if (label[i] == '-' && i + 1 < label.size() && label[i + 1] == ' ') {
      ++i;
      continue;
    }
    const auto c = static_cast<unsigned char>(label[i]);
    stem += (c == ' ') ? '_' : static_cast<char>(std::tolower(c));
  }
  return stem + "_plot";
}

ChartBuildResult PlotBuilder::build(const std::string& plot_name, const std::vector<std::string>& subjects,
                                    const std::string& band_type, const std::vector<stats::StatRecord>& records,
                                    PlotType plot_type) const {
  if (plot_type != PlotType::Range && plot_type != PlotType::Value) {
    return ChartBuildResult{.status = core::Status::InvalidInput,
                            .message = fmt::format("plot type {} must be one of (Range, Value)",
                                                   static_cast<int>(plot_type))};
  }

  // Range plots always trend the mean.
  Statistic trend = Statistic::Mean;
  if (plot_type == PlotType::Value) {
    if (subjects.empty() || !statistic_from_name(subjects.front(), trend)) {
      return ChartBuildResult{.status = core::Status::InvalidInput,
                              .message = fmt::format("unsupported plot subject '{}'",
                                                     subjects.empty() ? std::string{} : subjects.front())};
    }
  }

  const auto range = ranges_.resolve(band_type);
  if (range.status != core::Status::Ok) {
    return ChartBuildResult{.status = range.status, .message = range.message};
  }
  const BandTypeRangeSpec& spec = range.spec;
  if (!spec.valid()) {
    return ChartBuildResult{.status = core::Status::UnknownBandType,
                            .message = fmt::format("degenerate data range for band type key '{}'", range.key)};
  }

  auto series = build_sensor_time_series(records);
  if (series.status != core::Status::Ok) {
    return ChartBuildResult{.status = series.status, .message = series.message};
  }

  ChartBuildResult out{};
  ChartDescription& chart = out.chart;
  const std::string label = plot_label(plot_name, subjects);
  chart.output_stem = plot_output_stem(label);
  chart.plot_type = plot_type;
  chart.background_color = config_.background_color;
  chart.marker = config_.marker;
  chart.marker_size = config_.marker_size;

  const auto rescale = [&spec](const Eigen::ArrayXd& v) {
    return scale_to_range(v, spec.data_min, spec.data_max, spec.scale_min, spec.scale_max);
  };

  for (const core::SensorId sensor : series.sensors) {
    const auto& samples = series.samples.at(sensor);
    const Eigen::ArrayXd min_values = rescale(column(samples, &SensorSample::minimum));
    const Eigen::ArrayXd max_values = rescale(column(samples, &SensorSample::maximum));
    const Eigen::ArrayXd mean_values = rescale(column(samples, &SensorSample::mean));
    const Eigen::ArrayXd stddev_values = rescale(column(samples, &SensorSample::stddev));

    ChartSeries s{};
    s.sensor = sensor;
    s.label = std::string(core::sensor_name(sensor));
    s.color = config_.color_for(sensor);
    s.dates.reserve(samples.size());
    for (const auto& sample : samples) {
      s.dates.push_back(sample.date);
    }
    if (plot_type == PlotType::Range) {
      s.bar_low = to_vector(min_values);
      s.bar_high = to_vector(max_values);
    }
    switch (trend) {
      case Statistic::Minimum:
        s.values = to_vector(min_values);
        break;
      case Statistic::Maximum:
        s.values = to_vector(max_values);
        break;
      case Statistic::Mean:
        s.values = to_vector(mean_values);
        break;
      case Statistic::StdDev:
        s.values = to_vector(stddev_values);
        break;
    }
    chart.legend.push_back(s.label);
    chart.series.push_back(std::move(s));
  }

  chart.axes.y_min = spec.display_min - kDisplayPadding;
  chart.axes.y_max = spec.display_max + kDisplayPadding;
  chart.axes.y_max_ticks = spec.max_tick_count;
  chart.axes.y_label = label;
  chart.axes.x_min = series.min_date;
  chart.axes.x_max = series.max_date;
  pad_date_extents(chart.axes.x_min, chart.axes.x_max);
  return out;
}

ChartBuildResult PlotBuilder::build(const std::string& plot_name, PlotSubject subject, const std::string& band_type,
                                    const std::vector<stats::StatRecord>& records) const {
  const PlotType type = (subject == PlotSubject::Range) ? PlotType::Range : PlotType::Value;
  return build(plot_name, subject_names(subject), band_type, records, type);
}

PlotSetResult PlotBuilder::render_all(const std::string& plot_name, const std::string& band_type,
                                      const std::vector<stats::StatRecord>& records, IChartRenderer& renderer,
                                      const std::filesystem::path& output_dir) const {
  PlotSetResult out{};
  for (const PlotSubject subject : kStandardPlotSubjects) {
    const auto built = build(plot_name, subject, band_type, records);
    if (built.status != core::Status::Ok) {
      out.status = built.status;
      out.message = built.message;
      return out;
    }
    const auto rendered = renderer.render(built.chart, output_dir);
    if (rendered.status != core::Status::Ok) {
      out.status = rendered.status;
      out.message = rendered.message;
      return out;
    }
    spdlog::info("wrote plot: {}", rendered.image_file.string());
    out.images.push_back(rendered.image_file);
  }
  return out;
}

}  // namespace lpcs::plot
