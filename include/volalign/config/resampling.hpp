// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * resampling.hpp
 *
 * Resampling configuration: interpolation and out-of-volume fill.
 */

#ifndef VOLALIGN_CONFIG_RESAMPLING_HPP
#define VOLALIGN_CONFIG_RESAMPLING_HPP

namespace volalign {

/// Voxel interpolation used when rotating volumes.
enum class Interpolation {
  Nearest,  ///< Nearest neighbour (keeps label values intact)
  Linear    ///< Bilinear within each rotation plane
};

namespace config {

struct Resampling {
  Interpolation interpolation = Interpolation::Linear;
  float fill_value = 0.0f;  ///< Value for samples outside the source volume
};

}  // namespace config
}  // namespace volalign

#endif  // VOLALIGN_CONFIG_RESAMPLING_HPP
