/**
 * @file scene_identity.cpp
 * @brief Scene filename decoding implementation.
 * @author Watosn
 */

#include "lpcs/stats/scene_identity.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

#include "lpcs/core/calendar.hpp"

namespace lpcs::stats {
namespace {

constexpr std::size_t kModisYearOffset = 1;
constexpr std::size_t kLandsatYearOffset = 9;
constexpr std::size_t kYearWidth = 4;
constexpr std::size_t kDayOfYearWidth = 3;

bool parse_digits(const std::string& text, std::size_t start, std::size_t width, int& value) {
  if (text.size() < start + width) {
    return false;
  }
  int v = 0;
  for (std::size_t i = start; i < start + width; ++i) {
    const auto c = static_cast<unsigned char>(text[i]);
    if (std::isdigit(c) == 0) {
      return false;
    }
    v = v * 10 + (c - '0');
  }
  value = v;
  return true;
}

std::optional<SceneIdentity> identity_from_year_doy(const std::string& text, std::size_t year_offset,
                                                    core::SensorId sensor) {
  int year = 0;
  int day_of_year = 0;
  if (!parse_digits(text, year_offset, kYearWidth, year) ||
      !parse_digits(text, year_offset + kYearWidth, kDayOfYearWidth, day_of_year)) {
    return std::nullopt;
  }
  const auto md = core::month_day_from_day_of_year(year, day_of_year);
  if (!md.has_value()) {
    return std::nullopt;
  }
  return SceneIdentity{.year = year, .month = md->month, .day_of_month = md->day, .sensor = sensor};
}

}  // namespace

bool ModisNamingConvention::matches(const std::string& filename) const { return filename.starts_with(prefix_); }

std::optional<SceneIdentity> ModisNamingConvention::extract(const std::string& filename) const {
  const auto first_dot = filename.find('.');
  if (first_dot == std::string::npos) {
    return std::nullopt;
  }
  const auto second_dot = filename.find('.', first_dot + 1);
  const std::string date_segment = filename.substr(
      first_dot + 1, second_dot == std::string::npos ? std::string::npos : second_dot - first_dot - 1);
  return identity_from_year_doy(date_segment, kModisYearOffset, sensor_);
}

bool LandsatNamingConvention::matches(const std::string& filename) const {
  return filename.find(tag_) != std::string::npos;
}

std::optional<SceneIdentity> LandsatNamingConvention::extract(const std::string& filename) const {
  return identity_from_year_doy(filename, kLandsatYearOffset, sensor_);
}

const SceneIdentityResolver& SceneIdentityResolver::standard() {
  static const SceneIdentityResolver resolver = [] {
    SceneIdentityResolver r;
    r.add(std::make_unique<ModisNamingConvention>("MOD", core::SensorId::Terra));
    r.add(std::make_unique<ModisNamingConvention>("MYD", core::SensorId::Aqua));
    r.add(std::make_unique<LandsatNamingConvention>("LT4", core::SensorId::LT4));
    r.add(std::make_unique<LandsatNamingConvention>("LT5", core::SensorId::LT5));
    r.add(std::make_unique<LandsatNamingConvention>("LE7", core::SensorId::LE7));
    return r;
  }();
  return resolver;
}

void SceneIdentityResolver::add(std::unique_ptr<ISceneNamingConvention> convention) {
  if (!convention) {
    return;
  }
  conventions_.push_back(std::move(convention));
}

SceneIdentity SceneIdentityResolver::resolve(const std::filesystem::path& path) const {
  const std::string filename = path.filename().string();
  for (const auto& convention : conventions_) {
    if (!convention->matches(filename)) {
      continue;
    }
    // The first claiming convention decides, even when its digits are unusable.
    return convention->extract(filename).value_or(SceneIdentity{});
  }
  return SceneIdentity{};
}

SceneIdentity resolve_scene(const std::filesystem::path& path) { return SceneIdentityResolver::standard().resolve(path); }

}  // namespace lpcs::stats
