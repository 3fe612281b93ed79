// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "volalign/alignment/axis_order.hpp"

#include "volalign/exceptions.hpp"

namespace volalign {

AxisOrder parseAxisOrder(const std::string& text) {
  auto reject = [&text]() {
    return InvalidAxisOrderError(
        "parseAxisOrder",
        "axis order must be an arrangement of 'xyz', got '" + text + "'");
  };

  if (text.size() != 3) throw reject();

  AxisOrder order;
  bool seen[3] = {false, false, false};
  for (std::size_t i = 0; i < 3; ++i) {
    AxisLabel label;
    switch (text[i]) {
      case 'x':
        label = AxisLabel::X;
        break;
      case 'y':
        label = AxisLabel::Y;
        break;
      case 'z':
        label = AxisLabel::Z;
        break;
      default:
        throw reject();
    }
    const int index = static_cast<int>(label);
    if (seen[index]) throw reject();
    seen[index] = true;
    order.labels[i] = label;
  }
  return order;
}

char toChar(AxisLabel label) noexcept {
  switch (label) {
    case AxisLabel::X:
      return 'x';
    case AxisLabel::Y:
      return 'y';
    case AxisLabel::Z:
      return 'z';
  }
  return '?';
}

std::string toString(const AxisOrder& order) {
  std::string text;
  for (const auto label : order.labels) text.push_back(toChar(label));
  return text;
}

}  // namespace volalign
