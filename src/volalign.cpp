// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "volalign/volalign.hpp"

#include <spdlog/spdlog.h>

namespace volalign {

MajorAxisAligner::MajorAxisAligner() : MajorAxisAligner(Config{}) {}

MajorAxisAligner::MajorAxisAligner(const Config& cfg) : cfg_(cfg) {}

MajorAxisAligner& MajorAxisAligner::setAxisOrder(
    const std::string& axis_order) {
  cfg_.alignment.axis_order = parseAxisOrder(axis_order);
  return *this;
}

MajorAxisAligner& MajorAxisAligner::setAxisOrder(
    const AxisOrder& axis_order) noexcept {
  cfg_.alignment.axis_order = axis_order;
  return *this;
}

MajorAxisAligner& MajorAxisAligner::setReshape(bool reshape) noexcept {
  cfg_.alignment.reshape = reshape;
  return *this;
}

MajorAxisAligner& MajorAxisAligner::setInterpolation(
    Interpolation interpolation) noexcept {
  cfg_.resampling.interpolation = interpolation;
  return *this;
}

MajorAxisAligner& MajorAxisAligner::setFillValue(float fill_value) noexcept {
  cfg_.resampling.fill_value = fill_value;
  return *this;
}

RotationAngles MajorAxisAligner::computeAngles(const Image& image) const {
  return getAlignAngles(image, cfg_.alignment.axis_order);
}

Image MajorAxisAligner::align(const Image& image) const {
  const auto angles = computeAngles(image);
  return alignMajor(image, angles, cfg_.alignment.reshape, cfg_.resampling);
}

std::vector<Image> MajorAxisAligner::align(
    const std::vector<Image>& images) const {
  if (images.empty()) {
    spdlog::warn("[MajorAxisAligner] Received empty image list. Skipping...");
    return {};
  }

  const auto angles = computeAngles(images.front());
  return alignMajor(images, angles, cfg_.alignment.reshape, cfg_.resampling);
}

}  // namespace volalign
