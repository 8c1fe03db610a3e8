/**
 * @file catalog.cpp
 * @brief Band-type catalog definition.
 * @author Watosn
 */

#include "lpcs/pipeline/catalog.hpp"

#include <utility>

#include <fmt/format.h>

namespace lpcs::pipeline {
namespace {

std::vector<SensorSource> landsat(const std::string& product) {
  return {
      {.pattern = fmt::format("LT4*_{}.stats", product), .sensor_name = kLandsat4Name},
      {.pattern = fmt::format("LT5*_{}.stats", product), .sensor_name = kLandsat5Name},
      {.pattern = fmt::format("LE7*_{}.stats", product), .sensor_name = kLandsat7Name},
  };
}

std::vector<SensorSource> modis(const std::string& product_glob) {
  return {
      {.pattern = fmt::format("MOD*{}.stats", product_glob), .sensor_name = kTerraName},
      {.pattern = fmt::format("MYD*{}.stats", product_glob), .sensor_name = kAquaName},
  };
}

std::vector<SensorSource> landsat_and_modis(const std::string& landsat_product, const std::string& modis_glob) {
  auto sources = landsat(landsat_product);
  for (auto& s : modis(modis_glob)) {
    sources.push_back(std::move(s));
  }
  return sources;
}

std::vector<BandTypeGroup> build_catalog() {
  std::vector<BandTypeGroup> c;
  // MODIS SR bands 3, 4, 1, 2, 6, 7 map to Landsat SR bands 1, 2, 3, 4, 5, 7.
  c.push_back({.band_type = "SR Blue", .sources = landsat_and_modis("sr_band1", "sur_refl*3")});
  c.push_back({.band_type = "SR Green", .sources = landsat_and_modis("sr_band2", "sur_refl*4")});
  c.push_back({.band_type = "SR Red", .sources = landsat_and_modis("sr_band3", "sur_refl*1")});
  c.push_back({.band_type = "SR NIR", .sources = landsat_and_modis("sr_band4", "sur_refl*2")});
  c.push_back({.band_type = "SR SWIR1", .sources = landsat_and_modis("sr_band5", "sur_refl*6")});
  c.push_back({.band_type = "SR SWIR2", .sources = landsat_and_modis("sr_band7", "sur_refl*7")});

  c.push_back({.band_type = "SR SWIR B5", .sources = modis("sur_refl*b05")});

  c.push_back({.band_type = "SR Thermal", .sources = landsat("toa_band6")});

  c.push_back({.band_type = "TOA Blue", .sources = landsat("toa_band1")});
  c.push_back({.band_type = "TOA Green", .sources = landsat("toa_band2")});
  c.push_back({.band_type = "TOA Red", .sources = landsat("toa_band3")});
  c.push_back({.band_type = "TOA NIR", .sources = landsat("toa_band4")});
  c.push_back({.band_type = "TOA SWIR1", .sources = landsat("toa_band5")});
  c.push_back({.band_type = "TOA SWIR2", .sources = landsat("toa_band7")});

  for (const char* band : {"20", "22", "23", "29", "31", "32"}) {
    c.push_back({.band_type = fmt::format("Emis Band {}", band), .sources = modis(fmt::format("Emis_{}", band))});
  }

  c.push_back({.band_type = "LST Day", .sources = modis("LST_Day_*")});
  c.push_back({.band_type = "LST Night", .sources = modis("LST_Night_*")});

  c.push_back({.band_type = "NDVI", .sources = landsat_and_modis("sr_ndvi", "_NDVI")});
  c.push_back({.band_type = "EVI", .sources = landsat_and_modis("sr_evi", "_EVI")});
  c.push_back({.band_type = "SAVI", .sources = landsat("sr_savi")});
  c.push_back({.band_type = "MSAVI", .sources = landsat("sr_msavi")});
  c.push_back({.band_type = "NBR", .sources = landsat("sr_nbr")});
  c.push_back({.band_type = "NBR2", .sources = landsat("sr_nbr2")});
  c.push_back({.band_type = "NDMI", .sources = landsat("sr_ndmi")});
  return c;
}

}  // namespace

const std::vector<BandTypeGroup>& standard_catalog() {
  static const std::vector<BandTypeGroup> catalog = build_catalog();
  return catalog;
}

}  // namespace lpcs::pipeline
