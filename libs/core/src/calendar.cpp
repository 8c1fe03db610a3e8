/**
 * @file calendar.cpp
 * @brief Calendar helper implementation.
 * @author Watosn
 */

#include "lpcs/core/calendar.hpp"

#include <array>

#include <fmt/format.h>

namespace lpcs::core {
namespace {

constexpr std::array<int, 12> kDaysPerMonth = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

}  // namespace

bool is_leap_year(int year) noexcept { return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0; }

int days_in_month(int year, int month) noexcept {
  if (month < 1 || month > 12) {
    return 0;
  }
  if (month == 2 && is_leap_year(year)) {
    return 29;
  }
  return kDaysPerMonth[static_cast<std::size_t>(month - 1)];
}

int days_in_year(int year) noexcept { return is_leap_year(year) ? 366 : 365; }

std::optional<MonthDay> month_day_from_day_of_year(int year, int day_of_year) noexcept {
  if (day_of_year < 1 || day_of_year > days_in_year(year)) {
    return std::nullopt;
  }
  int remaining = day_of_year;
  for (int month = 1; month <= 12; ++month) {
    const int month_days = days_in_month(year, month);
    if (remaining <= month_days) {
      return MonthDay{.month = month, .day = remaining};
    }
    remaining -= month_days;
  }
  return std::nullopt;
}

int days_from_civil(const CivilDate& date) noexcept {
  int y = date.year;
  const auto m = static_cast<unsigned>(date.month);
  const auto d = static_cast<unsigned>(date.day);
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

CivilDate civil_from_days(int days) noexcept {
  const int z = days + 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  const unsigned d = doy - (153U * mp + 2U) / 5U + 1U;
  const unsigned m = mp < 10U ? mp + 3U : mp - 9U;
  return CivilDate{.year = y + static_cast<int>(m <= 2U), .month = static_cast<int>(m), .day = static_cast<int>(d)};
}

CivilDate add_days(const CivilDate& date, int days) noexcept { return civil_from_days(days_from_civil(date) + days); }

std::string iso_date(const CivilDate& date) { return fmt::format("{:04d}-{:02d}-{:02d}", date.year, date.month, date.day); }

}  // namespace lpcs::core
