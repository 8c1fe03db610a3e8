/**
 * @file calendar.hpp
 * @brief Proleptic Gregorian calendar helpers (day-of-year, civil day arithmetic).
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>

#include "lpcs/core/types.hpp"

namespace lpcs::core {

/**
 * @brief Month/day pair produced by a day-of-year conversion.
 */
struct MonthDay {
  int month{};
  int day{};
};

[[nodiscard]] bool is_leap_year(int year) noexcept;
[[nodiscard]] int days_in_month(int year, int month) noexcept;
[[nodiscard]] int days_in_year(int year) noexcept;

/**
 * @brief Convert a 1-based day of year to month and day of month.
 * @return std::nullopt when `day_of_year` is outside `1..days_in_year(year)`.
 */
[[nodiscard]] std::optional<MonthDay> month_day_from_day_of_year(int year, int day_of_year) noexcept;

/**
 * @brief Days since 1970-01-01 for a civil date.
 */
[[nodiscard]] int days_from_civil(const CivilDate& date) noexcept;

/**
 * @brief Civil date for a day count since 1970-01-01.
 */
[[nodiscard]] CivilDate civil_from_days(int days) noexcept;

/**
 * @brief Shift a civil date by a signed number of days.
 */
[[nodiscard]] CivilDate add_days(const CivilDate& date, int days) noexcept;

/**
 * @brief Format as ISO `YYYY-MM-DD` (zero padded, `0000-00-00` for an empty date).
 */
[[nodiscard]] std::string iso_date(const CivilDate& date);

}  // namespace lpcs::core
