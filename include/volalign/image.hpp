// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * image.hpp
 *
 * Dense N-dimensional float image (row-major, last axis fastest) with
 * rank normalization helpers for (B, C, Z, Y, X) volumes.
 */

#ifndef VOLALIGN_IMAGE_HPP
#define VOLALIGN_IMAGE_HPP

#include <array>
#include <cstddef>
#include <string>
#include <unsupported/Eigen/CXX11/Tensor>
#include <vector>

namespace volalign {

using Index = Eigen::Index;
using Shape = std::vector<Index>;

/// Rank-5 (batch, channel, z, y, x) shape used internally by all algorithms.
using CanonicalShape = std::array<Index, 5>;

/// Single spatial volume, indexed (z, y, x).
using Volume = Eigen::Tensor<float, 3, Eigen::RowMajor>;

/// Read-only rank-5 view over image storage.
using CanonicalView =
    Eigen::TensorMap<const Eigen::Tensor<float, 5, Eigen::RowMajor>>;

constexpr int kSpatialRank = 3;
constexpr int kMinImageRank = 3;
constexpr int kMaxImageRank = 5;

/**
 * @brief N-dimensional dense image.
 *
 * Storage follows NumPy C order: the last axis is contiguous. Images used by
 * the alignment algorithms have rank 3 (Z, Y, X), 4 (C, Z, Y, X) or
 * 5 (B, C, Z, Y, X); the container itself accepts any rank so that the
 * algorithms can reject bad inputs with a meaningful error.
 *
 * Usage:
 * @code
 *   Image cell({3, 10, 10, 10});        // CZYX, zero filled
 *   cell(0, 5, 5, 2) = 1.0f;
 *   Image projection = cell.meanOverLeading();  // ZYX
 * @endcode
 */
class Image {
 public:
  Image() = default;

  /// Allocate with every element set to fill.
  explicit Image(Shape shape, float fill = 0.0f);

  /// Take ownership of row-major data (size must match the shape).
  Image(Shape shape, std::vector<float> data);

  /// Copy a single spatial volume into a rank-3 image.
  static Image fromVolume(const Volume& volume);

  const Shape& shape() const noexcept { return shape_; }
  int rank() const noexcept { return static_cast<int>(shape_.size()); }
  Index size() const noexcept { return static_cast<Index>(data_.size()); }
  bool empty() const noexcept { return data_.empty(); }

  float* data() noexcept { return data_.data(); }
  const float* data() const noexcept { return data_.data(); }
  const std::vector<float>& values() const noexcept { return data_; }

  /// Element access; the number of indices must equal rank().
  template <typename... Idx>
  float& operator()(Idx... idx) {
    const std::array<Index, sizeof...(Idx)> index{{static_cast<Index>(idx)...}};
    return data_[offset(index.data(), index.size())];
  }

  template <typename... Idx>
  float operator()(Idx... idx) const {
    const std::array<Index, sizeof...(Idx)> index{{static_cast<Index>(idx)...}};
    return data_[offset(index.data(), index.size())];
  }

  float& at(const Shape& index) {
    return data_[offset(index.data(), index.size())];
  }
  float at(const Shape& index) const {
    return data_[offset(index.data(), index.size())];
  }

  void fill(float value);

  /// Last three extents (Z, Y, X). Requires rank >= 3.
  Shape spatialShape() const;

  /// Number of spatial volumes (product of the leading extents).
  Index leadingCount() const;

  /// i-th spatial volume in row-major order of the leading axes.
  Volume volumeTensor(Index i) const;
  Image volume(Index i) const;

  /// Same data with a new leading axis of length 1.
  Image expandDims() const;

  /// Rank-3 mean over all leading axes.
  Image meanOverLeading() const;

  bool operator==(const Image& other) const;
  bool operator!=(const Image& other) const { return !(*this == other); }

 private:
  Index offset(const Index* index, std::size_t count) const;

  Shape shape_;
  std::vector<float> data_;
};

/**
 * @brief Pad a rank-3/4/5 shape to (B, C, Z, Y, X).
 *
 * Single rank validation point for the alignment algorithms.
 *
 * @throws InvalidImageError if the rank is not 3, 4 or 5, or a spatial
 *         extent is zero.
 */
CanonicalShape canonicalShape(const Shape& shape);

/// Rank-5 view over the image storage (validates like canonicalShape).
CanonicalView canonicalView(const Image& image);

/// "(3, 10, 10, 10)" style formatting for log and error messages.
std::string toString(const Shape& shape);

}  // namespace volalign

#endif  // VOLALIGN_IMAGE_HPP
