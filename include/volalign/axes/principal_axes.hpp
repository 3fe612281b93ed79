// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * principal_axes.hpp
 *
 * Major/minor axis extraction from the voxel mass distribution of an image
 * (intensity-weighted PCA over voxel coordinates).
 */

#ifndef VOLALIGN_AXES_PRINCIPAL_AXES_HPP
#define VOLALIGN_AXES_PRINCIPAL_AXES_HPP

#include <Eigen/Core>
#include <utility>

#include "volalign/image.hpp"

namespace volalign {

/**
 * @brief Principal axes of a voxel mass distribution.
 *
 * Vectors are expressed as (x, y, z) components, where x runs along the last
 * image axis. Axis signs are arbitrary: compare with magnitudes only.
 */
struct PrincipalAxes {
  Eigen::Vector3d major = Eigen::Vector3d::UnitX();  ///< Largest variance
  Eigen::Vector3d minor = Eigen::Vector3d::UnitZ();  ///< Smallest variance
  Eigen::Vector3d eigenvalues = Eigen::Vector3d::Zero();  ///< Ascending
  Eigen::Vector3d centroid = Eigen::Vector3d::Zero();     ///< Weighted mean
  double total_weight = 0.0;
};

/**
 * @brief Intensity-weighted covariance of voxel coordinates.
 *
 * Voxels with non-positive or non-finite values carry no weight.
 *
 * @param volume Spatial volume (z, y, x)
 * @param[out] centroid Weighted mean position (x, y, z)
 * @param[out] total_weight Sum of voxel weights
 * @return 3x3 covariance in (x, y, z) order, normalized by the total weight
 */
Eigen::Matrix3d computeWeightedCovariance(const Volume& volume,
                                          Eigen::Vector3d& centroid,
                                          double& total_weight);

/**
 * @brief Principal axes of an image.
 *
 * Leading (batch/channel) axes are averaged away first, so 3-D, 4-D and
 * 5-D forms of the same volume give identical results.
 *
 * @throws InvalidImageError if the rank is not 3, 4 or 5
 * @throws EmptyImageError if the image has zero total mass
 */
PrincipalAxes computePrincipalAxes(const Image& image);

/// Major and minor axis only; see computePrincipalAxes().
std::pair<Eigen::Vector3d, Eigen::Vector3d> getMajorMinorAxis(
    const Image& image);

}  // namespace volalign

#endif  // VOLALIGN_AXES_PRINCIPAL_AXES_HPP
