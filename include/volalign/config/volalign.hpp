// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef VOLALIGN_CONFIG_VOLALIGN_HPP
#define VOLALIGN_CONFIG_VOLALIGN_HPP

#include <string>

namespace YAML {
class Node;
}

#include "volalign/config/alignment.hpp"
#include "volalign/config/resampling.hpp"

namespace volalign {

/// Configuration for major axis alignment.
struct Config {
  config::Alignment alignment;
  config::Resampling resampling;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace volalign

#endif  // VOLALIGN_CONFIG_VOLALIGN_HPP
