/**
 * @file scene_identity.hpp
 * @brief Acquisition date and sensor decoding from scene filenames.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lpcs/core/types.hpp"

namespace lpcs::stats {

/**
 * @brief Acquisition date and sensor of one scene.
 *
 * An unresolved scene is `{0, 0, 0, Unknown}`.
 */
struct SceneIdentity {
  int year{};
  int month{};
  int day_of_month{};
  core::SensorId sensor{core::SensorId::Unknown};

  [[nodiscard]] bool resolved() const noexcept { return sensor != core::SensorId::Unknown; }
  [[nodiscard]] core::CivilDate date() const noexcept {
    return core::CivilDate{.year = year, .month = month, .day = day_of_month};
  }
};

/**
 * @brief One sensor-specific filename naming convention.
 */
class ISceneNamingConvention {
 public:
  virtual ~ISceneNamingConvention() = default;
  /**
   * @brief True when the convention claims this filename.
   */
  [[nodiscard]] virtual bool matches(const std::string& filename) const = 0;
  /**
   * @brief Decode a claimed filename.
   * @return std::nullopt when the date digits are malformed or out of range.
   */
  [[nodiscard]] virtual std::optional<SceneIdentity> extract(const std::string& filename) const = 0;
};

/**
 * @brief MODIS names: `<prefix>...` with `.AYYYYDDD.` as the second dot-separated segment.
 */
class ModisNamingConvention final : public ISceneNamingConvention {
 public:
  ModisNamingConvention(std::string prefix, core::SensorId sensor) : prefix_(std::move(prefix)), sensor_(sensor) {}

  [[nodiscard]] bool matches(const std::string& filename) const override;
  [[nodiscard]] std::optional<SceneIdentity> extract(const std::string& filename) const override;

 private:
  std::string prefix_{};
  core::SensorId sensor_{core::SensorId::Unknown};
};

/**
 * @brief Landsat scene ids containing a sensor tag, year at [9,13) and day of year at [13,16).
 */
class LandsatNamingConvention final : public ISceneNamingConvention {
 public:
  LandsatNamingConvention(std::string tag, core::SensorId sensor) : tag_(std::move(tag)), sensor_(sensor) {}

  [[nodiscard]] bool matches(const std::string& filename) const override;
  [[nodiscard]] std::optional<SceneIdentity> extract(const std::string& filename) const override;

 private:
  std::string tag_{};
  core::SensorId sensor_{core::SensorId::Unknown};
};

/**
 * @brief Ordered registry of naming conventions, first match wins.
 */
class SceneIdentityResolver final {
 public:
  /**
   * @brief Resolver with the MOD, MYD, LT4, LT5, LE7 conventions in that order.
   */
  static const SceneIdentityResolver& standard();

  /**
   * @brief Append a convention; it is evaluated after all earlier ones.
   */
  void add(std::unique_ptr<ISceneNamingConvention> convention);

  /**
   * @brief Resolve a scene from the basename of `path`.
   * @return Identity; unresolved when no convention matches or decoding fails.
   */
  [[nodiscard]] SceneIdentity resolve(const std::filesystem::path& path) const;

 private:
  std::vector<std::unique_ptr<ISceneNamingConvention>> conventions_{};
};

/**
 * @brief Shorthand for `SceneIdentityResolver::standard().resolve(path)`.
 */
[[nodiscard]] SceneIdentity resolve_scene(const std::filesystem::path& path);

}  // namespace lpcs::stats
