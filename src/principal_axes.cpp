// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * principal_axes.cpp
 *
 * Weighted second-moment analysis of voxel positions.
 */

#include "volalign/axes/principal_axes.hpp"

#include <spdlog/spdlog.h>

#include <Eigen/Eigenvalues>
#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "volalign/exceptions.hpp"

namespace volalign {

Eigen::Matrix3d computeWeightedCovariance(const Volume& volume,
                                          Eigen::Vector3d& centroid,
                                          double& total_weight) {
  const Index nz = volume.dimension(0);
  const Index ny = volume.dimension(1);
  const Index nx = volume.dimension(2);

  // Single pass: weighted first and second moments
  double weight_sum = 0.0;
  Eigen::Vector3d sum = Eigen::Vector3d::Zero();
  Eigen::Matrix3d sum_sq = Eigen::Matrix3d::Zero();

  for (Index z = 0; z < nz; ++z) {
    for (Index y = 0; y < ny; ++y) {
      for (Index x = 0; x < nx; ++x) {
        const double w = volume(z, y, x);
        if (!std::isfinite(w) || w <= 0.0) continue;

        const Eigen::Vector3d p(static_cast<double>(x), static_cast<double>(y),
                                static_cast<double>(z));
        weight_sum += w;
        sum += w * p;
        sum_sq.noalias() += w * p * p.transpose();
      }
    }
  }

  total_weight = weight_sum;
  if (weight_sum <= 0.0) {
    centroid.setZero();
    return Eigen::Matrix3d::Zero();
  }

  const double inv_w = 1.0 / weight_sum;
  centroid = sum * inv_w;
  return sum_sq * inv_w - centroid * centroid.transpose();
}

PrincipalAxes computePrincipalAxes(const Image& image) {
  // Leading axes collapse to their mean; only spatial structure matters
  const Eigen::array<Index, 2> leading{{0, 1}};
  const Volume volume = canonicalView(image).mean(leading);

  PrincipalAxes axes;
  const Eigen::Matrix3d cov =
      computeWeightedCovariance(volume, axes.centroid, axes.total_weight);
  if (axes.total_weight <= 0.0) {
    throw EmptyImageError("getMajorMinorAxis",
                          "image " + toString(image.shape()) +
                              " has no mass, principal axes are undefined");
  }

  Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> solver(cov);
  if (solver.info() != Eigen::Success) {
    throw std::runtime_error("[getMajorMinorAxis] eigen-decomposition failed");
  }

  // Eigenvalues ascending: column 2 = major, column 0 = minor
  axes.eigenvalues = solver.eigenvalues();
  axes.major = solver.eigenvectors().col(2);
  axes.minor = solver.eigenvectors().col(0);

  constexpr double kTieTolerance = 1e-9;
  const double scale = std::max(axes.eigenvalues(2), 1.0);
  if (axes.eigenvalues(2) - axes.eigenvalues(1) < kTieTolerance * scale ||
      axes.eigenvalues(1) - axes.eigenvalues(0) < kTieTolerance * scale) {
    spdlog::warn(
        "[AxisExtractor] Tied eigenvalues ({:.4g}, {:.4g}, {:.4g}) for image "
        "{}, axis choice is arbitrary",
        axes.eigenvalues(0), axes.eigenvalues(1), axes.eigenvalues(2),
        toString(image.shape()));
  }

  spdlog::debug(
      "[AxisExtractor] major=({:.4f}, {:.4f}, {:.4f}) "
      "minor=({:.4f}, {:.4f}, {:.4f}) weight={}",
      axes.major.x(), axes.major.y(), axes.major.z(), axes.minor.x(),
      axes.minor.y(), axes.minor.z(), axes.total_weight);

  return axes;
}

std::pair<Eigen::Vector3d, Eigen::Vector3d> getMajorMinorAxis(
    const Image& image) {
  const auto axes = computePrincipalAxes(image);
  return {axes.major, axes.minor};
}

}  // namespace volalign
