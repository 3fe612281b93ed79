// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef VOLALIGN_ALIGNMENT_AXIS_ORDER_HPP
#define VOLALIGN_ALIGNMENT_AXIS_ORDER_HPP

#include <array>
#include <string>

namespace volalign {

/// Spatial axis label; the value is the vector component index.
enum class AxisLabel {
  X = 0,  ///< Last image axis
  Y = 1,
  Z = 2   ///< Third-from-last image axis
};

/**
 * @brief Target placement of the principal axes.
 *
 * labels[0] receives the major axis, labels[2] the minor axis; labels[1] is
 * implied by elimination.
 */
struct AxisOrder {
  std::array<AxisLabel, 3> labels{AxisLabel::Z, AxisLabel::Y, AxisLabel::X};

  int majorIndex() const noexcept { return static_cast<int>(labels[0]); }
  int middleIndex() const noexcept { return static_cast<int>(labels[1]); }
  int minorIndex() const noexcept { return static_cast<int>(labels[2]); }
};

/**
 * @brief Parse "xyz"-style axis order.
 *
 * @throws InvalidAxisOrderError unless the string is exactly a permutation of
 *         'x', 'y' and 'z'
 */
AxisOrder parseAxisOrder(const std::string& text);

/// Inverse of parseAxisOrder().
std::string toString(const AxisOrder& order);

char toChar(AxisLabel label) noexcept;

}  // namespace volalign

#endif  // VOLALIGN_ALIGNMENT_AXIS_ORDER_HPP
