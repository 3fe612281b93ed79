// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "volalign/geometry/vector_geometry.hpp"

#include <cmath>
#include <string>

#include "volalign/exceptions.hpp"

namespace volalign {

namespace {

bool isVector(const Eigen::MatrixXd& m) {
  return m.size() > 0 && (m.rows() == 1 || m.cols() == 1);
}

std::string describe(const Eigen::MatrixXd& m) {
  return std::to_string(m.rows()) + "x" + std::to_string(m.cols());
}

}  // namespace

double angleBetween(const Eigen::MatrixXd& u, const Eigen::MatrixXd& v) {
  if (!isVector(u) || !isVector(v)) {
    throw InvalidInputError("angleBetween",
                            "inputs must be 1-D vectors, got " + describe(u) +
                                " and " + describe(v));
  }
  if (u.size() != v.size()) {
    throw InvalidInputError("angleBetween",
                            "vector lengths differ (" +
                                std::to_string(u.size()) + " vs " +
                                std::to_string(v.size()) + ")");
  }

  const Eigen::Map<const Eigen::VectorXd> a(u.data(), u.size());
  const Eigen::Map<const Eigen::VectorXd> b(v.data(), v.size());
  const double norm_a = a.norm();
  const double norm_b = b.norm();
  if (norm_a == 0.0 || norm_b == 0.0) {
    throw InvalidInputError("angleBetween", "zero-length vector");
  }

  // Half-angle form 2 atan2(|a|b| - b|a||, |a|b| + b|a||); exact 0 for (v, v)
  const Eigen::VectorXd scaled_a = a * norm_b;
  const Eigen::VectorXd scaled_b = b * norm_a;
  const double angle = 2.0 * std::atan2((scaled_a - scaled_b).norm(),
                                        (scaled_a + scaled_b).norm());
  return angle * 180.0 / M_PI;
}

Eigen::Vector3d normalizeDirection(const Eigen::Vector3d& v) {
  const double norm = v.norm();
  if (norm == 0.0) return v;
  Eigen::Vector3d unit = v / norm;
  if (unit(dominantAxis(unit)) < 0.0) unit = -unit;
  return unit;
}

int dominantAxis(const Eigen::Vector3d& v) {
  Eigen::Index index = 0;
  v.cwiseAbs().maxCoeff(&index);
  return static_cast<int>(index);
}

}  // namespace volalign
