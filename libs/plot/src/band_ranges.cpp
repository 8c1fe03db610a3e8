/**
 * @file band_ranges.cpp
 * @brief Band-type range registry implementation.
 * @author Watosn
 */

#include "lpcs/plot/band_ranges.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace lpcs::plot {
namespace {

constexpr BandTypeRangeSpec kReflectance{.data_min = 0.0,
                                         .data_max = 10000.0,
                                         .scale_min = 0.0,
                                         .scale_max = 1.0,
                                         .display_min = 0.0,
                                         .display_max = 1.0,
                                         .max_tick_count = 12};

constexpr BandTypeRangeSpec kSpectralIndex{.data_min = -1000.0,
                                           .data_max = 10000.0,
                                           .scale_min = -0.1,
                                           .scale_max = 1.0,
                                           .display_min = -0.1,
                                           .display_max = 1.0,
                                           .max_tick_count = 13};

constexpr BandTypeRangeSpec kLandSurfaceTemperature{.data_min = 7500.0,
                                                    .data_max = 65535.0,
                                                    .scale_min = 0.0,
                                                    .scale_max = 1.0,
                                                    .display_min = 0.0,
                                                    .display_max = 1.0,
                                                    .max_tick_count = 12};

constexpr BandTypeRangeSpec kEmissivity{.data_min = 1.0,
                                        .data_max = 255.0,
                                        .scale_min = 0.0,
                                        .scale_max = 1.0,
                                        .display_min = 0.0,
                                        .display_max = 1.0,
                                        .max_tick_count = 12};

}  // namespace

const BandTypeRangeRegistry& BandTypeRangeRegistry::standard() {
  static const BandTypeRangeRegistry registry({
      {.key = "SR", .spec = kReflectance},
      {.key = "TOA", .spec = kReflectance},
      {.key = "NDVI", .spec = kSpectralIndex},
      {.key = "EVI", .spec = kSpectralIndex},
      {.key = "SAVI", .spec = kSpectralIndex},
      {.key = "MSAVI", .spec = kSpectralIndex},
      {.key = "NBR", .spec = kSpectralIndex},
      {.key = "NBR2", .spec = kSpectralIndex},
      {.key = "NDMI", .spec = kSpectralIndex},
      {.key = "LST", .spec = kLandSurfaceTemperature},
      {.key = "Emis", .spec = kEmissivity},
  });
  return registry;
}

BandTypeRangeRegistry::BandTypeRangeRegistry(std::vector<BandTypeRangeEntry> entries) : entries_(std::move(entries)) {
  std::stable_sort(entries_.begin(), entries_.end(), [](const BandTypeRangeEntry& a, const BandTypeRangeEntry& b) {
    return a.key.size() > b.key.size();
  });
}

BandTypeRangeLookup BandTypeRangeRegistry::resolve(const std::string& band_type) const {
  for (const auto& entry : entries_) {
    if (band_type.starts_with(entry.key)) {
      return BandTypeRangeLookup{.key = entry.key, .spec = entry.spec};
    }
  }
  return BandTypeRangeLookup{.status = core::Status::UnknownBandType,
                             .message = fmt::format("no data range registered for band type '{}'", band_type)};
}

}  // namespace lpcs::plot
