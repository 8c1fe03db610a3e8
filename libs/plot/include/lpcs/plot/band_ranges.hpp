/**
 * @file band_ranges.hpp
 * @brief Per-band-type data, scale and display ranges.
 * @author Watosn
 */
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "lpcs/core/types.hpp"

namespace lpcs::plot {

/**
 * @brief Numeric ranges used to normalize one band-type category.
 *
 * `data_*` bounds the raw statistic values, which are mapped linearly onto
 * `scale_*`. `display_*` is the visible Y range before padding, and
 * `max_tick_count` bounds the number of Y intervals (including the padding
 * above the top tick and below the bottom one).
 */
struct BandTypeRangeSpec {
  double data_min{};
  double data_max{};
  double scale_min{};
  double scale_max{};
  double display_min{};
  double display_max{};
  int max_tick_count{};

  [[nodiscard]] bool valid() const noexcept { return data_max > data_min && max_tick_count > 0; }
};

/**
 * @brief Registry key and its range spec.
 */
struct BandTypeRangeEntry {
  std::string key{};
  BandTypeRangeSpec spec{};
};

/**
 * @brief Result of resolving a band-type label.
 */
struct BandTypeRangeLookup {
  std::string key{};
  BandTypeRangeSpec spec{};
  core::Status status{core::Status::Ok};
  std::string message{};
};

/**
 * @brief Ordered prefix-keyed registry of band-type ranges.
 *
 * Entries are kept longest key first, so "NBR2 ..." never resolves to "NBR".
 */
class BandTypeRangeRegistry final {
 public:
  /**
   * @brief SR, TOA, NDVI, EVI, SAVI, MSAVI, NBR, NBR2, NDMI, LST and Emis ranges.
   */
  static const BandTypeRangeRegistry& standard();

  explicit BandTypeRangeRegistry(std::vector<BandTypeRangeEntry> entries);

  /**
   * @brief Find the most specific key that prefixes `band_type`.
   * @return Lookup with `UnknownBandType` status when no key matches.
   */
  [[nodiscard]] BandTypeRangeLookup resolve(const std::string& band_type) const;

  [[nodiscard]] const std::vector<BandTypeRangeEntry>& entries() const noexcept { return entries_; }

 private:
  std::vector<BandTypeRangeEntry> entries_{};
};

}  // namespace lpcs::plot
