/**
 * @file test_band_ranges.cpp
 * @brief Band-type range registry tests.
 * @author Watosn
 */

#include <spdlog/spdlog.h>

#include "lpcs/pipeline/catalog.hpp"
#include "lpcs/plot/band_ranges.hpp"

int main() {
  using lpcs::core::Status;
  using lpcs::plot::BandTypeRangeRegistry;

  const auto& registry = BandTypeRangeRegistry::standard();
  if (registry.entries().size() != 11) {
    spdlog::error("standard registry should hold 11 keys, got {}", registry.entries().size());
    return 1;
  }
  for (const auto& entry : registry.entries()) {
    if (!entry.spec.valid()) {
      spdlog::error("invalid range spec for {}", entry.key);
      return 2;
    }
  }

  const auto nbr2 = registry.resolve("NBR2");
  const auto nbr = registry.resolve("NBR");
  if (nbr2.status != Status::Ok || nbr2.key != "NBR2" || nbr.key != "NBR") {
    spdlog::error("NBR2 must not resolve to NBR");
    return 3;
  }

  // Declared order does not matter; the longest key wins.
  const BandTypeRangeRegistry custom({{.key = "NBR", .spec = {.data_min = 0, .data_max = 1, .max_tick_count = 1}},
                                      {.key = "NBR2", .spec = {.data_min = 0, .data_max = 2, .max_tick_count = 1}}});
  if (custom.resolve("NBR2 extra").key != "NBR2") {
    spdlog::error("custom registry should prefer the longer key");
    return 4;
  }

  const auto sr = registry.resolve("SR Blue");
  const auto toa = registry.resolve("TOA SWIR2");
  const auto lst = registry.resolve("LST Night");
  const auto emis = registry.resolve("Emis Band 31");
  const auto ndvi = registry.resolve("NDVI");
  if (sr.spec.data_max != 10000.0 || sr.spec.max_tick_count != 12 || toa.spec.data_max != 10000.0 ||
      lst.spec.data_min != 7500.0 || lst.spec.data_max != 65535.0 || emis.spec.data_min != 1.0 ||
      emis.spec.data_max != 255.0 || ndvi.spec.data_min != -1000.0 || ndvi.spec.scale_min != -0.1 ||
      ndvi.spec.max_tick_count != 13) {
    spdlog::error("range values mismatch");
    return 5;
  }

  const auto unknown = registry.resolve("Cloud Mask");
  if (unknown.status != Status::UnknownBandType) {
    spdlog::error("unregistered band type should be UnknownBandType");
    return 6;
  }

  for (const auto& group : lpcs::pipeline::standard_catalog()) {
    if (registry.resolve(group.band_type).status != Status::Ok) {
      spdlog::error("catalog band type {} has no range", group.band_type);
      return 7;
    }
  }

  return 0;
}
