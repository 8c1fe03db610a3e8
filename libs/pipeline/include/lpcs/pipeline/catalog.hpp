/**
 * @file catalog.hpp
 * @brief Band-type catalog: filename patterns and sensor names per tracked band.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

namespace lpcs::pipeline {

/**
 * @brief One filename glob and the satellite name it contributes as.
 */
struct SensorSource {
  std::string pattern{};
  std::string sensor_name{};
};

/**
 * @brief All sources of one band type, in search order.
 */
struct BandTypeGroup {
  std::string band_type{};
  std::vector<SensorSource> sources{};
};

inline constexpr const char* kLandsat4Name = "Landsat 4";
inline constexpr const char* kLandsat5Name = "Landsat 5";
inline constexpr const char* kLandsat7Name = "Landsat 7";
inline constexpr const char* kTerraName = "Terra";
inline constexpr const char* kAquaName = "Aqua";

/**
 * @brief The fixed processing catalog, in processing order.
 */
[[nodiscard]] const std::vector<BandTypeGroup>& standard_catalog();

}  // namespace lpcs::pipeline
