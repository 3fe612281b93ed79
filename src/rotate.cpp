// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rotate.cpp
 *
 * Plane-by-plane resampling of volumes and rank-normalized batch rotation.
 */

#include "volalign/rotation/rotate.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cmath>
#include <string>
#include <utility>

#include "volalign/exceptions.hpp"

namespace volalign {

namespace {

/// Extents in (x, y, z) component order.
using Extent3 = std::array<Index, 3>;

Extent3 componentExtents(const Volume& volume) {
  return {volume.dimension(2), volume.dimension(1), volume.dimension(0)};
}

/// Rotated in-plane extent for a plane of n_a x n_b voxels.
Index grownExtent(double c, double s, Index n_a, Index n_b) {
  return static_cast<Index>(std::floor(std::abs(c) * static_cast<double>(n_a) +
                                       std::abs(s) * static_cast<double>(n_b) +
                                       0.5));
}

}  // namespace

Volume rotateVolume(const Volume& volume, const PlaneRotation& rotation,
                    bool reshape, const config::Resampling& resampling) {
  validateRotations({rotation});

  const int k = rotation.axis;
  const int i = (k + 1) % 3;
  const int j = (k + 2) % 3;
  const double c = cosDeg(rotation.degrees);
  const double s = sinDeg(rotation.degrees);

  const Extent3 n_in = componentExtents(volume);
  Extent3 n_out = n_in;
  if (reshape) {
    n_out[i] = grownExtent(c, s, n_in[i], n_in[j]);
    n_out[j] = grownExtent(s, c, n_in[i], n_in[j]);
  }

  Volume output(n_out[2], n_out[1], n_out[0]);
  const float fill = resampling.fill_value;

  const double in_ci = (static_cast<double>(n_in[i]) - 1.0) / 2.0;
  const double in_cj = (static_cast<double>(n_in[j]) - 1.0) / 2.0;
  const double out_ci = (static_cast<double>(n_out[i]) - 1.0) / 2.0;
  const double out_cj = (static_cast<double>(n_out[j]) - 1.0) / 2.0;

  Extent3 p{0, 0, 0};  // output position
  Extent3 q{0, 0, 0};  // input position

  // Input voxel on the current slice, or fill outside the volume
  auto voxel = [&](Index qi, Index qj) -> float {
    if (qi < 0 || qi >= n_in[i] || qj < 0 || qj >= n_in[j]) return fill;
    q[i] = qi;
    q[j] = qj;
    return volume(q[2], q[1], q[0]);
  };

  for (p[2] = 0; p[2] < n_out[2]; ++p[2]) {
    for (p[1] = 0; p[1] < n_out[1]; ++p[1]) {
      for (p[0] = 0; p[0] < n_out[0]; ++p[0]) {
        q[k] = p[k];

        // Inverse rotation: R^T (p - c_out) + c_in
        const double di = static_cast<double>(p[i]) - out_ci;
        const double dj = static_cast<double>(p[j]) - out_cj;
        const double si = c * di + s * dj + in_ci;
        const double sj = -s * di + c * dj + in_cj;

        float value = fill;
        if (resampling.interpolation == Interpolation::Nearest) {
          value = voxel(static_cast<Index>(std::floor(si + 0.5)),
                        static_cast<Index>(std::floor(sj + 0.5)));
        } else if (si > -1.0 && si < static_cast<double>(n_in[i]) &&
                   sj > -1.0 && sj < static_cast<double>(n_in[j])) {
          const double fi0 = std::floor(si);
          const double fj0 = std::floor(sj);
          const Index i0 = static_cast<Index>(fi0);
          const Index j0 = static_cast<Index>(fj0);
          const double ti = si - fi0;
          const double tj = sj - fj0;

          // Skip zero-weight corners; the fill value may be NaN
          double acc = 0.0;
          for (int a = 0; a < 2; ++a) {
            const double wi = a ? ti : 1.0 - ti;
            if (wi == 0.0) continue;
            for (int b = 0; b < 2; ++b) {
              const double wj = b ? tj : 1.0 - tj;
              if (wj == 0.0) continue;
              acc += wi * wj * static_cast<double>(voxel(i0 + a, j0 + b));
            }
          }
          value = static_cast<float>(acc);
        }
        output(p[2], p[1], p[0]) = value;
      }
    }
  }

  return output;
}

Image alignMajor(const Image& image, const RotationAngles& angles,
                 bool reshape, const config::Resampling& resampling) {
  const CanonicalShape dims = canonicalShape(image.shape());
  validateRotations(angles);

  const Index count = dims[0] * dims[1];
  std::vector<float> data;
  Shape spatial;

  for (Index n = 0; n < count; ++n) {
    Volume volume = image.volumeTensor(n);
    for (const auto& rotation : angles) {
      volume = rotateVolume(volume, rotation, reshape, resampling);
    }

    if (n == 0) {
      spatial = {volume.dimension(0), volume.dimension(1),
                 volume.dimension(2)};
      data.reserve(static_cast<std::size_t>(count * volume.size()));
    }
    data.insert(data.end(), volume.data(), volume.data() + volume.size());
  }

  // Restore the input leading axes
  Shape shape(image.shape().begin(), image.shape().end() - kSpatialRank);
  shape.insert(shape.end(), spatial.begin(), spatial.end());

  spdlog::debug("[Rotator] {} -> {} ({} volume(s), {} rotation(s))",
                toString(image.shape()), toString(shape), count,
                angles.size());
  return Image(std::move(shape), std::move(data));
}

std::vector<Image> alignMajor(const std::vector<Image>& images,
                              const RotationAngles& angles, bool reshape,
                              const config::Resampling& resampling) {
  // Fail fast: no partial output on a bad image
  for (std::size_t n = 0; n < images.size(); ++n) {
    try {
      canonicalShape(images[n].shape());
    } catch (const InvalidImageError& e) {
      throw InvalidImageError(
          "alignMajor", "image " + std::to_string(n) + ": " + e.getMessage());
    }
  }
  validateRotations(angles);

  std::vector<Image> rotated;
  rotated.reserve(images.size());
  for (const auto& image : images) {
    rotated.push_back(alignMajor(image, angles, reshape, resampling));
  }
  return rotated;
}

}  // namespace volalign
