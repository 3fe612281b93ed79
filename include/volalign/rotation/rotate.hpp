// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rotate.hpp
 *
 * Rotation of 3-D, 4-D and 5-D images by a shared sequence of plane
 * rotations.
 */

#ifndef VOLALIGN_ROTATION_ROTATE_HPP
#define VOLALIGN_ROTATION_ROTATE_HPP

#include <vector>

#include "volalign/config/resampling.hpp"
#include "volalign/image.hpp"
#include "volalign/rotation/plane_rotation.hpp"

namespace volalign {

/**
 * @brief Rotate one spatial volume about its center.
 *
 * The output voxel p samples the input at R^T (p - c_out) + c_in, with
 * c = (extent - 1) / 2 per component. With reshape, the two in-plane
 * extents grow to floor(|cos| n_i + |sin| n_j + 0.5) and
 * floor(|sin| n_i + |cos| n_j + 0.5); otherwise the shape is kept.
 *
 * @param volume Input volume (z, y, x)
 * @param rotation Plane rotation in (x, y, z) component space
 * @param reshape Grow the bounding box to hold all rotated content
 * @param resampling Interpolation and fill value
 */
Volume rotateVolume(const Volume& volume, const PlaneRotation& rotation,
                    bool reshape,
                    const config::Resampling& resampling = {});

/**
 * @brief Apply a rotation sequence to every spatial volume of an image.
 *
 * Rank 4/5 images are rotated slice by slice over their leading axes, every
 * slice with the same angles. The result keeps the input rank and leading
 * extents.
 *
 * @throws InvalidImageError if the rank is not 3, 4 or 5 or an axis is empty
 * @throws ValidationError if a rotation has a bad axis or angle
 */
Image alignMajor(const Image& image, const RotationAngles& angles,
                 bool reshape = true,
                 const config::Resampling& resampling = {});

/**
 * @brief Batch version; all images are validated before any is rotated.
 *
 * @return Rotated images in input order
 */
std::vector<Image> alignMajor(const std::vector<Image>& images,
                              const RotationAngles& angles,
                              bool reshape = true,
                              const config::Resampling& resampling = {});

}  // namespace volalign

#endif  // VOLALIGN_ROTATION_ROTATE_HPP
