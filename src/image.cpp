// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "volalign/image.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "volalign/exceptions.hpp"

namespace volalign {

namespace {

Index elementCount(const Shape& shape) {
  if (std::find(shape.begin(), shape.end(), 0) != shape.end()) return 0;
  Index count = 1;
  for (const auto extent : shape) {
    if (extent > 0 &&
        count > std::numeric_limits<Index>::max() / extent) {
      throw InvalidImageError("Image", "element count of shape " +
                                           toString(shape) + " overflows");
    }
    count *= extent;
  }
  return count;
}

void checkExtents(const Shape& shape) {
  for (const auto extent : shape) {
    if (extent < 0) {
      throw InvalidImageError("Image",
                              "negative extent in shape " + toString(shape));
    }
  }
}

}  // namespace

Image::Image(Shape shape, float fill) : shape_(std::move(shape)) {
  checkExtents(shape_);
  data_.assign(static_cast<std::size_t>(elementCount(shape_)), fill);
}

Image::Image(Shape shape, std::vector<float> data)
    : shape_(std::move(shape)), data_(std::move(data)) {
  checkExtents(shape_);
  if (static_cast<Index>(data_.size()) != elementCount(shape_)) {
    throw InvalidImageError(
        "Image", "shape " + toString(shape_) + " needs " +
                     std::to_string(elementCount(shape_)) + " values, got " +
                     std::to_string(data_.size()));
  }
}

Image Image::fromVolume(const Volume& volume) {
  const auto& dims = volume.dimensions();
  std::vector<float> data(volume.data(), volume.data() + volume.size());
  return Image({dims[0], dims[1], dims[2]}, std::move(data));
}

void Image::fill(float value) { std::fill(data_.begin(), data_.end(), value); }

Shape Image::spatialShape() const {
  if (rank() < kSpatialRank) {
    throw InvalidImageError("Image", "rank " + std::to_string(rank()) +
                                         " has no spatial volume");
  }
  return Shape(shape_.end() - kSpatialRank, shape_.end());
}

Index Image::leadingCount() const {
  if (rank() < kSpatialRank) return 0;
  return std::accumulate(shape_.begin(), shape_.end() - kSpatialRank,
                         Index{1}, std::multiplies<Index>());
}

Volume Image::volumeTensor(Index i) const {
  const auto view = canonicalView(*this);
  const Index channels = view.dimension(1);
  if (i < 0 || i >= view.dimension(0) * channels) {
    throw std::out_of_range("volume index " + std::to_string(i) +
                            " out of range for shape " + toString(shape_));
  }
  Volume volume = view.chip(i / channels, 0).chip(i % channels, 0);
  return volume;
}

Image Image::volume(Index i) const { return fromVolume(volumeTensor(i)); }

Image Image::expandDims() const {
  Shape shape = shape_;
  shape.insert(shape.begin(), 1);
  return Image(std::move(shape), data_);
}

Image Image::meanOverLeading() const {
  const Eigen::array<Index, 2> leading{{0, 1}};
  Volume mean = canonicalView(*this).mean(leading);
  return fromVolume(mean);
}

bool Image::operator==(const Image& other) const {
  return shape_ == other.shape_ && data_ == other.data_;
}

Index Image::offset(const Index* index, std::size_t count) const {
  if (count != shape_.size()) {
    throw std::out_of_range("expected " + std::to_string(shape_.size()) +
                            " indices, got " + std::to_string(count));
  }
  Index flat = 0;
  for (std::size_t axis = 0; axis < count; ++axis) {
    if (index[axis] < 0 || index[axis] >= shape_[axis]) {
      throw std::out_of_range("index " + std::to_string(index[axis]) +
                              " out of range for axis " +
                              std::to_string(axis) + " of " +
                              toString(shape_));
    }
    flat = flat * shape_[axis] + index[axis];
  }
  return flat;
}

CanonicalShape canonicalShape(const Shape& shape) {
  const int rank = static_cast<int>(shape.size());
  if (rank < kMinImageRank || rank > kMaxImageRank) {
    throw InvalidImageError(
        "canonicalShape", "image must have 3 to 5 dimensions, got shape " +
                              toString(shape));
  }

  CanonicalShape canonical{1, 1, 1, 1, 1};
  std::copy(shape.begin(), shape.end(),
            canonical.end() - static_cast<std::ptrdiff_t>(rank));

  for (int axis = 0; axis < 5; ++axis) {
    if (canonical[axis] <= 0) {
      throw InvalidImageError("canonicalShape",
                              "image has an empty axis, shape " +
                                  toString(shape));
    }
  }
  return canonical;
}

CanonicalView canonicalView(const Image& image) {
  const auto dims = canonicalShape(image.shape());
  return CanonicalView(image.data(), dims);
}

std::string toString(const Shape& shape) {
  std::ostringstream os;
  os << "(";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    if (i > 0) os << ", ";
    os << shape[i];
  }
  if (shape.size() == 1) os << ",";
  os << ")";
  return os.str();
}

}  // namespace volalign
