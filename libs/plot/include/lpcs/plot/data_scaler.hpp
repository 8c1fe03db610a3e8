/**
 * @file data_scaler.hpp
 * @brief Linear rescaling of statistic values between ranges.
 * @author Watosn
 */
#pragma once

#include <Eigen/Dense>

namespace lpcs::plot {

/**
 * @brief Map `value` from [data_low, data_high] onto [target_low, target_high].
 *
 * Orientation is preserved (data_high -> target_high). Requires data_high != data_low.
 */
[[nodiscard]] inline double scale_to_range(double value, double data_low, double data_high, double target_low,
                                           double target_high) noexcept {
  return target_high - ((target_high - target_low) * (data_high - value)) / (data_high - data_low);
}

/**
 * @brief Element-wise `scale_to_range` over a series.
 */
[[nodiscard]] inline Eigen::ArrayXd scale_to_range(const Eigen::ArrayXd& values, double data_low, double data_high,
                                                   double target_low, double target_high) {
  return target_high - ((target_high - target_low) * (data_high - values)) / (data_high - data_low);
}

}  // namespace lpcs::plot
