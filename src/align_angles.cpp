// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * align_angles.cpp
 *
 * Axis alignment angles from principal axes.
 */

#include "volalign/alignment/align_angles.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

#include "volalign/axes/principal_axes.hpp"

namespace volalign {

namespace {

/// Fold into (-90, 90]: an axis and its negation are the same axis.
double foldAxisAngle(double degrees) {
  double a = std::fmod(degrees, 180.0);
  if (a > 90.0) {
    a -= 180.0;
  } else if (a <= -90.0) {
    a += 180.0;
  }
  return a;
}

}  // namespace

double planeAlignAngle(const Eigen::Vector3d& v, int about, int target) {
  const int i = (about + 1) % 3;
  const int j = (about + 2) % 3;

  constexpr double kMinProjection = 1e-12;
  const double projection = std::hypot(v(i), v(j));
  if (projection <= kMinProjection * v.norm() || projection == 0.0) {
    return 0.0;
  }

  // Polar angle of the projection in the (i, j) plane
  const double phi = std::atan2(v(j), v(i)) * 180.0 / M_PI;
  const double goal = (target == i) ? 0.0 : 90.0;
  return foldAxisAngle(goal - phi);
}

RotationAngles computeAlignAngles(const Eigen::Vector3d& major,
                                  const Eigen::Vector3d& minor,
                                  const AxisOrder& order) {
  const int a = order.majorIndex();
  const int b = order.middleIndex();
  const int c = order.minorIndex();

  Eigen::Vector3d major_r = major;
  Eigen::Vector3d minor_r = minor;
  RotationAngles angles;
  angles.reserve(3);

  auto apply = [&](int about, double degrees) {
    const PlaneRotation rotation{about, degrees};
    const Eigen::Matrix3d R = rotationMatrix(rotation);
    major_r = R * major_r;
    minor_r = R * minor_r;
    angles.push_back(rotation);
  };

  // 1. Major axis projection onto a (turning in the (a, b) plane)
  apply(c, planeAlignAngle(major_r, c, a));
  // 2. Major axis onto a (turning in the (a, c) plane)
  apply(b, planeAlignAngle(major_r, b, a));
  // 3. Minor axis onto c; the major axis is the rotation axis now
  apply(a, planeAlignAngle(minor_r, a, c));

  return angles;
}

RotationAngles getAlignAngles(const Image& image,
                              const std::string& axis_order) {
  return getAlignAngles(image, parseAxisOrder(axis_order));
}

RotationAngles getAlignAngles(const Image& image, const AxisOrder& order) {
  const auto axes = computePrincipalAxes(image);
  auto angles = computeAlignAngles(axes.major, axes.minor, order);

  spdlog::debug("[AngleSolver] '{}' -> [{}: {:.3f}, {}: {:.3f}, {}: {:.3f}]",
                toString(order), angles[0].axis, angles[0].degrees,
                angles[1].axis, angles[1].degrees, angles[2].axis,
                angles[2].degrees);
  return angles;
}

}  // namespace volalign
