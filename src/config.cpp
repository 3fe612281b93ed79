// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <stdexcept>

#include "volalign/config/volalign.hpp"
#include "volalign/exceptions.hpp"

namespace volalign {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Interpolation parseInterpolation(const std::string& name) {
  if (name == "nearest") return Interpolation::Nearest;
  if (name == "linear" || name == "bilinear") return Interpolation::Linear;
  spdlog::warn("[Config] Unknown interpolation '{}', defaulting to linear",
               name);
  return Interpolation::Linear;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Alignment target
  if (auto n = root["alignment"]) {
    std::string order_str;
    load(n, "axis_order", order_str);
    if (!order_str.empty()) {
      cfg.alignment.axis_order = parseAxisOrder(order_str);
    }
    load(n, "reshape", cfg.alignment.reshape);
  }

  // Resampling
  if (auto n = root["resampling"]) {
    std::string interpolation_str;
    load(n, "interpolation", interpolation_str);
    if (!interpolation_str.empty()) {
      cfg.resampling.interpolation = parseInterpolation(interpolation_str);
    }
    load(n, "fill_value", cfg.resampling.fill_value);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Non-fatal: warn and reset ---
  if (!std::isfinite(cfg.resampling.fill_value)) {
    spdlog::warn("[Config] resampling.fill_value ({}) must be finite, "
                 "resetting to 0",
                 cfg.resampling.fill_value);
    cfg.resampling.fill_value = 0.0f;
  }
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace volalign
