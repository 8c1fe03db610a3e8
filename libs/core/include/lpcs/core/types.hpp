/**
 * @file types.hpp
 * @brief Core domain types for lpcs.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace lpcs::core {

/**
 * @brief Standard status code used by every result struct.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  MissingField,
  UnknownBandType,
  IoError,
  CommandFailed,
  ChecksumMismatch
};

/**
 * @brief Instrument/platform that acquired a scene.
 */
enum class SensorId : std::uint8_t { Terra, Aqua, LT4, LT5, LE7, Unknown };

/**
 * @brief Proleptic Gregorian calendar date.
 */
struct CivilDate {
  int year{};
  int month{};
  int day{};
};

inline bool operator==(const CivilDate& a, const CivilDate& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const CivilDate& a, const CivilDate& b) { return !(a == b); }
inline bool operator<(const CivilDate& a, const CivilDate& b) {
  if (a.year != b.year) {
    return a.year < b.year;
  }
  if (a.month != b.month) {
    return a.month < b.month;
  }
  return a.day < b.day;
}
inline bool operator>(const CivilDate& a, const CivilDate& b) { return b < a; }

/**
 * @brief Short name of a status code for log messages.
 */
inline std::string_view status_name(Status status) {
  switch (status) {
    case Status::Ok:
      return "Ok";
    case Status::InvalidInput:
      return "InvalidInput";
    case Status::MissingField:
      return "MissingField";
    case Status::UnknownBandType:
      return "UnknownBandType";
    case Status::IoError:
      return "IoError";
    case Status::CommandFailed:
      return "CommandFailed";
    case Status::ChecksumMismatch:
      return "ChecksumMismatch";
  }
  return "Unknown";
}

/**
 * @brief Legend/colour key of a sensor ("Terra", "LT5", ...).
 */
inline std::string_view sensor_name(SensorId sensor) {
  switch (sensor) {
    case SensorId::Terra:
      return "Terra";
    case SensorId::Aqua:
      return "Aqua";
    case SensorId::LT4:
      return "LT4";
    case SensorId::LT5:
      return "LT5";
    case SensorId::LE7:
      return "LE7";
    case SensorId::Unknown:
      break;
  }
  return "unk";
}

}  // namespace lpcs::core
