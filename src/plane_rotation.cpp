// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "volalign/rotation/plane_rotation.hpp"

#include <string>

#include "volalign/exceptions.hpp"

namespace volalign {

Eigen::Matrix3d rotationMatrix(const PlaneRotation& rotation) {
  const int k = rotation.axis;
  const int i = (k + 1) % 3;
  const int j = (k + 2) % 3;
  const double c = cosDeg(rotation.degrees);
  const double s = sinDeg(rotation.degrees);

  Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
  R(i, i) = c;
  R(i, j) = -s;
  R(j, i) = s;
  R(j, j) = c;
  return R;
}

Eigen::Matrix3d rotationMatrix(const RotationAngles& angles) {
  Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
  for (const auto& rotation : angles) {
    R = rotationMatrix(rotation) * R;
  }
  return R;
}

void validateRotations(const RotationAngles& angles) {
  for (std::size_t n = 0; n < angles.size(); ++n) {
    const auto& rotation = angles[n];
    if (rotation.axis < 0 || rotation.axis > 2) {
      throw ValidationError("alignMajor",
                            "rotation " + std::to_string(n) +
                                " has axis " + std::to_string(rotation.axis) +
                                ", expected 0 (x), 1 (y) or 2 (z)");
    }
    if (!std::isfinite(rotation.degrees)) {
      throw ValidationError("alignMajor", "rotation " + std::to_string(n) +
                                              " has a non-finite angle");
    }
  }
}

}  // namespace volalign
