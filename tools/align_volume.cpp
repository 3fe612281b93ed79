// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * align_volume: rotate a .npy volume so its principal axes follow an axis
 * order.
 *
 * Pipeline: load → principal axes → alignment angles → rotate → save
 *
 * Usage:
 *   ./align_volume input.npy output.npy [axis_order] [config.yaml]
 *
 * Example:
 *   ./align_volume cell.npy cell_aligned.npy zyx
 */

#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <volalign/io/npy.hpp>
#include <volalign/volalign.hpp>

using namespace volalign;

namespace {

void printAxes(const std::string& label, const Image& image) {
  const auto [major, minor] = getMajorMinorAxis(image);
  std::cout << std::fixed << std::setprecision(4) << "  " << label
            << " major=(" << major.x() << ", " << major.y() << ", "
            << major.z() << ") minor=(" << minor.x() << ", " << minor.y()
            << ", " << minor.z() << ")" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "Usage: align_volume <input.npy> <output.npy> [axis_order] "
                 "[config.yaml]\n"
              << "  axis_order: major, middle, minor target (default: zyx)\n";
    return 1;
  }

  const std::string input_path = argv[1];
  const std::string output_path = argv[2];

  try {
    Config config;
    if (argc >= 5) config = loadConfig(argv[4]);
    MajorAxisAligner aligner(config);
    if (argc >= 4) aligner.setAxisOrder(argv[3]);

    // Load
    std::cout << "Loading " << input_path << " ..." << std::endl;
    Image image;
    if (!io::loadNpy(input_path, image)) return 1;
    std::cout << "  Shape: " << toString(image.shape()) << std::endl;
    printAxes("before:", image);

    // Align
    const auto angles = aligner.computeAngles(image);
    const auto& cfg = aligner.config();
    std::cout << "Aligning to '" << toString(cfg.alignment.axis_order)
              << "' ..." << std::endl;
    for (const auto& rotation : angles) {
      std::cout << "  about " << "xyz"[rotation.axis] << ": "
                << rotation.degrees << " deg" << std::endl;
    }
    const Image aligned =
        alignMajor(image, angles, cfg.alignment.reshape, cfg.resampling);
    std::cout << "  Shape: " << toString(aligned.shape()) << std::endl;
    printAxes("after: ", aligned);

    // Export
    if (!io::saveNpy(output_path, aligned)) return 1;
    std::cout << "Saved to " << output_path << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
