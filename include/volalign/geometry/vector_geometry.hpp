// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * vector_geometry.hpp
 *
 * Stateless helpers on direction vectors.
 */

#ifndef VOLALIGN_GEOMETRY_VECTOR_GEOMETRY_HPP
#define VOLALIGN_GEOMETRY_VECTOR_GEOMETRY_HPP

#include <Eigen/Core>

namespace volalign {

/**
 * @brief Angle between two vectors in degrees, in [0, 180].
 *
 * Uses the half-angle atan2 form, so angleBetween(v, v) is exactly 0.
 *
 * @param u Row or column vector
 * @param v Row or column vector of the same length
 * @throws InvalidInputError if an input is not 1-D, lengths differ, or an
 *         input has zero length or zero norm
 */
double angleBetween(const Eigen::MatrixXd& u, const Eigen::MatrixXd& v);

/// Unit vector with its largest-magnitude component made positive.
/// Picks one representative of a sign-ambiguous axis.
Eigen::Vector3d normalizeDirection(const Eigen::Vector3d& v);

/// Index of the largest |component| (0 = x, 1 = y, 2 = z).
int dominantAxis(const Eigen::Vector3d& v);

}  // namespace volalign

#endif  // VOLALIGN_GEOMETRY_VECTOR_GEOMETRY_HPP
