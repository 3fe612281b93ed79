// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * align_angles.hpp
 *
 * Rotation angles that bring the major axis onto the first label of an axis
 * order and the minor axis onto the last.
 */

#ifndef VOLALIGN_ALIGNMENT_ALIGN_ANGLES_HPP
#define VOLALIGN_ALIGNMENT_ALIGN_ANGLES_HPP

#include <Eigen/Core>
#include <string>

#include "volalign/alignment/axis_order.hpp"
#include "volalign/image.hpp"
#include "volalign/rotation/plane_rotation.hpp"

namespace volalign {

/**
 * @brief Angle about `about` that turns v onto the `target` axis.
 *
 * Works on the projection of v into the plane normal to `about`. Axes are
 * sign agnostic, so the result is folded into (-90, 90]. A vanishing
 * projection gives 0.
 */
double planeAlignAngle(const Eigen::Vector3d& v, int about, int target);

/**
 * @brief Rotation sequence for known principal axes.
 *
 * With a = order major label, b = middle, c = minor label:
 *   1. about c: major projection onto a
 *   2. about b: major onto a
 *   3. about a: minor onto c
 *
 * @return {{c, t1}, {b, t2}, {a, t3}}
 */
RotationAngles computeAlignAngles(const Eigen::Vector3d& major,
                                  const Eigen::Vector3d& minor,
                                  const AxisOrder& order);

/**
 * @brief Rotation sequence aligning the principal axes of an image.
 *
 * Leading batch/channel axes do not change the result.
 *
 * @throws InvalidAxisOrderError if axis_order is not a permutation of "xyz"
 * @throws InvalidImageError if the image rank is not 3, 4 or 5
 * @throws EmptyImageError if the image has no mass
 */
RotationAngles getAlignAngles(const Image& image,
                              const std::string& axis_order = "zyx");

RotationAngles getAlignAngles(const Image& image, const AxisOrder& order);

}  // namespace volalign

#endif  // VOLALIGN_ALIGNMENT_ALIGN_ANGLES_HPP
