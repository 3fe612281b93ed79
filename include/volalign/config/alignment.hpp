// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef VOLALIGN_CONFIG_ALIGNMENT_HPP
#define VOLALIGN_CONFIG_ALIGNMENT_HPP

#include "volalign/alignment/axis_order.hpp"

namespace volalign::config {

struct Alignment {
  AxisOrder axis_order;  // default "zyx": major -> z, minor -> x
  bool reshape = true;   // grow the bounding box instead of clipping
};

}  // namespace volalign::config

#endif  // VOLALIGN_CONFIG_ALIGNMENT_HPP
