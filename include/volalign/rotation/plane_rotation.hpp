// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * plane_rotation.hpp
 *
 * Elementary rotations in coordinate planes.
 */

#ifndef VOLALIGN_ROTATION_PLANE_ROTATION_HPP
#define VOLALIGN_ROTATION_PLANE_ROTATION_HPP

#include <Eigen/Core>
#include <cmath>
#include <vector>

namespace volalign {

/**
 * @brief Right-handed rotation about one coordinate axis.
 *
 * Turns the plane spanned by the two other components: for axis k the
 * plane is (i, j) = ((k + 1) % 3, (k + 2) % 3), and e_i rotates towards
 * e_j for positive angles.
 */
struct PlaneRotation {
  int axis = 0;          ///< Component rotated about (0 = x, 1 = y, 2 = z)
  double degrees = 0.0;  ///< Rotation angle [deg]

  bool operator==(const PlaneRotation& other) const {
    return axis == other.axis && degrees == other.degrees;
  }
  bool operator!=(const PlaneRotation& other) const {
    return !(*this == other);
  }
};

/// Rotations applied in sequence order; shared by every image of a batch.
using RotationAngles = std::vector<PlaneRotation>;

/// cos(deg) with exact results on multiples of 90 degrees.
inline double cosDeg(double degrees) {
  const double r = std::fmod(degrees, 360.0);
  if (r == 0.0) return 1.0;
  if (r == 180.0 || r == -180.0) return -1.0;
  if (r == 90.0 || r == -90.0 || r == 270.0 || r == -270.0) return 0.0;
  return std::cos(degrees * M_PI / 180.0);
}

/// sin(deg) with exact results on multiples of 90 degrees.
inline double sinDeg(double degrees) {
  const double r = std::fmod(degrees, 360.0);
  if (r == 0.0 || r == 180.0 || r == -180.0) return 0.0;
  if (r == 90.0 || r == -270.0) return 1.0;
  if (r == -90.0 || r == 270.0) return -1.0;
  return std::sin(degrees * M_PI / 180.0);
}

/// 3x3 rotation matrix acting on (x, y, z) vectors.
Eigen::Matrix3d rotationMatrix(const PlaneRotation& rotation);

/// Composite matrix of a sequence (first entry applied first).
Eigen::Matrix3d rotationMatrix(const RotationAngles& angles);

/// @throws ValidationError on an axis outside [0, 2] or a non-finite angle.
void validateRotations(const RotationAngles& angles);

}  // namespace volalign

#endif  // VOLALIGN_ROTATION_PLANE_ROTATION_HPP
