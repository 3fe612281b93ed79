// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * volalign.hpp
 *
 * volalign: major axis alignment of volumetric images.
 */

#ifndef VOLALIGN_VOLALIGN_HPP
#define VOLALIGN_VOLALIGN_HPP

#include <string>
#include <vector>

// Configs
#include "volalign/config/volalign.hpp"

// Data types
#include "volalign/exceptions.hpp"
#include "volalign/image.hpp"

// Core functions
#include "volalign/alignment/align_angles.hpp"
#include "volalign/alignment/axis_order.hpp"
#include "volalign/axes/principal_axes.hpp"
#include "volalign/geometry/vector_geometry.hpp"
#include "volalign/rotation/rotate.hpp"

namespace volalign {

/**
 * @brief Aligns the principal axes of one image or a batch.
 *
 * Angles are derived from one representative image (the first of a batch)
 * and applied unchanged to every image, so co-registered channels or masks
 * stay consistent.
 *
 * Usage:
 * @code
 *   MajorAxisAligner aligner;
 *   aligner.setAxisOrder("xyz").setReshape(false);
 *   auto aligned = aligner.align({membrane, nucleus});
 * @endcode
 *
 * Configure once, then use from any thread: computation is const.
 */
class MajorAxisAligner {
 public:
  /// Construct with default config (use setters to customize)
  MajorAxisAligner();

  /// Construct with explicit config
  explicit MajorAxisAligner(const Config& cfg);

  /// Target axis order; throws InvalidAxisOrderError on a bad string
  MajorAxisAligner& setAxisOrder(const std::string& axis_order);
  MajorAxisAligner& setAxisOrder(const AxisOrder& axis_order) noexcept;

  /// Grow (true) or keep (false) the output bounding box
  MajorAxisAligner& setReshape(bool reshape) noexcept;

  MajorAxisAligner& setInterpolation(Interpolation interpolation) noexcept;
  MajorAxisAligner& setFillValue(float fill_value) noexcept;

  const Config& config() const noexcept { return cfg_; }

  /// Rotation sequence for the configured axis order
  RotationAngles computeAngles(const Image& image) const;

  /// Align a single image with angles derived from itself
  Image align(const Image& image) const;

  /// Align a batch with angles derived from images.front()
  std::vector<Image> align(const std::vector<Image>& images) const;

 private:
  Config cfg_;
};

}  // namespace volalign

#endif  // VOLALIGN_VOLALIGN_HPP
