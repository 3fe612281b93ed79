// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * npy.hpp
 *
 * NumPy .npy format for Image serialization.
 * Compatible with numpy.load() / numpy.save() in Python.
 */

#ifndef VOLALIGN_IO_NPY_HPP
#define VOLALIGN_IO_NPY_HPP

#include <string>

#include "volalign/image.hpp"

namespace volalign {
namespace io {

/// Save as '<f4', C order, any rank.
bool saveNpy(const std::string& filename, const Image& image);

/// Load a C-order little-endian array ('<f4', '<f8', '|u1', '<u2', '<i4'
/// or '|b1'), converting values to float.
bool loadNpy(const std::string& filename, Image& image);

}  // namespace io
}  // namespace volalign

#endif  // VOLALIGN_IO_NPY_HPP
