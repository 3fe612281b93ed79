// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_npy.cpp
 *
 * NumPy .npy reader/writer for images.
 */

#include "volalign/io/npy.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace volalign {
namespace io {

namespace detail {

// ─── NumPy .npy format ──────────────────────────────────────────────────────

constexpr char kMagic[] = {'\x93', 'N', 'U', 'M', 'P', 'Y'};
constexpr std::size_t kMaxDataBytes = 4'000'000'000ull;  // 4GB

std::string shapeTuple(const Shape& shape) {
  std::ostringstream os;
  os << "(";
  for (std::size_t i = 0; i < shape.size(); ++i) {
    os << shape[i];
    if (shape.size() == 1 || i + 1 < shape.size()) os << ",";
    if (i + 1 < shape.size()) os << " ";
  }
  os << ")";
  return os.str();
}

std::vector<char> buildNpyHeader(const Shape& shape) {
  std::ostringstream dict;
  dict << "{'descr': '<f4', 'fortran_order': False, 'shape': "
       << shapeTuple(shape) << ", }";
  std::string dict_str = dict.str();

  // Pad to 64-byte alignment
  const std::size_t prefix_len = 10;  // 6 (magic) + 2 (version) + 2 (len)
  std::size_t padding = 64 - ((prefix_len + dict_str.size() + 1) % 64);
  if (padding == 64) padding = 0;
  dict_str.append(padding, ' ');
  dict_str.push_back('\n');

  const uint16_t header_len = static_cast<uint16_t>(dict_str.size());

  std::vector<char> buf;
  buf.reserve(prefix_len + header_len);
  buf.insert(buf.end(), kMagic, kMagic + 6);
  buf.push_back('\x01');  // version 1.0
  buf.push_back('\x00');
  buf.push_back(static_cast<char>(header_len & 0xFF));
  buf.push_back(static_cast<char>((header_len >> 8) & 0xFF));
  buf.insert(buf.end(), dict_str.begin(), dict_str.end());
  return buf;
}

// ─── .npy header parser ────────────────────────────────────────────────────

enum class DType { Float32, Float64, UInt8, UInt16, Int32, Bool };

struct NpyInfo {
  DType dtype = DType::Float32;
  std::size_t item_size = 4;
  bool fortran_order = false;
  Shape shape;
};

bool parseDescr(const std::string& descr, NpyInfo& info) {
  if (descr == "<f4") {
    info.dtype = DType::Float32;
    info.item_size = 4;
  } else if (descr == "<f8") {
    info.dtype = DType::Float64;
    info.item_size = 8;
  } else if (descr == "|u1") {
    info.dtype = DType::UInt8;
    info.item_size = 1;
  } else if (descr == "<u2") {
    info.dtype = DType::UInt16;
    info.item_size = 2;
  } else if (descr == "<i4") {
    info.dtype = DType::Int32;
    info.item_size = 4;
  } else if (descr == "|b1") {
    info.dtype = DType::Bool;
    info.item_size = 1;
  } else {
    return false;
  }
  return true;
}

// Extract the quoted value after 'key':
bool dictString(const std::string& dict, const std::string& key,
                std::string& out) {
  auto pos = dict.find("'" + key + "'");
  if (pos == std::string::npos) return false;
  pos = dict.find(':', pos);
  if (pos == std::string::npos) return false;
  auto q1 = dict.find('\'', pos + 1);
  if (q1 == std::string::npos) return false;
  auto q2 = dict.find('\'', q1 + 1);
  if (q2 == std::string::npos) return false;
  out = dict.substr(q1 + 1, q2 - q1 - 1);
  return true;
}

bool parseShape(const std::string& dict, Shape& shape) {
  auto pos = dict.find("'shape'");
  if (pos == std::string::npos) return false;
  auto paren = dict.find('(', pos);
  if (paren == std::string::npos) return false;
  auto paren_end = dict.find(')', paren);
  if (paren_end == std::string::npos) return false;

  // "(3, 10, 10)", "(5,)" or "()"
  std::stringstream inner(dict.substr(paren + 1, paren_end - paren - 1));
  std::string token;
  shape.clear();
  while (std::getline(inner, token, ',')) {
    const auto first = token.find_first_not_of(' ');
    if (first == std::string::npos) continue;
    try {
      const long long extent = std::stoll(token.substr(first));
      if (extent < 0) return false;
      shape.push_back(static_cast<Index>(extent));
    } catch (const std::exception&) {
      return false;
    }
  }
  return true;
}

bool parseNpyHeader(std::istream& is, NpyInfo& info) {
  char magic[6];
  is.read(magic, 6);
  if (is.fail() || std::memcmp(magic, kMagic, 6) != 0) return false;

  uint8_t version[2];
  is.read(reinterpret_cast<char*>(version), 2);
  if (is.fail()) return false;

  uint32_t header_len = 0;
  if (version[0] == 1) {
    uint8_t b[2];
    is.read(reinterpret_cast<char*>(b), 2);
    header_len = static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8);
  } else if (version[0] == 2 || version[0] == 3) {
    uint8_t b[4];
    is.read(reinterpret_cast<char*>(b), 4);
    header_len = static_cast<uint32_t>(b[0]) |
                 (static_cast<uint32_t>(b[1]) << 8) |
                 (static_cast<uint32_t>(b[2]) << 16) |
                 (static_cast<uint32_t>(b[3]) << 24);
  } else {
    return false;
  }
  if (is.fail() || header_len == 0 || header_len > 65536) return false;

  std::string dict(header_len, '\0');
  is.read(&dict[0], header_len);
  if (is.fail()) return false;

  std::string descr;
  if (!dictString(dict, "descr", descr) || !parseDescr(descr, info)) {
    spdlog::error("[npy_io] Unsupported dtype '{}'", descr);
    return false;
  }
  info.fortran_order = dict.find("'fortran_order': True") != std::string::npos;
  return parseShape(dict, info.shape);
}

template <typename T>
void convert(const std::vector<char>& raw, std::vector<float>& out) {
  const std::size_t count = out.size();
  if (count == 0) return;
  std::vector<T> typed(count);
  std::memcpy(typed.data(), raw.data(), count * sizeof(T));
  for (std::size_t i = 0; i < count; ++i) {
    out[i] = static_cast<float>(typed[i]);
  }
}

}  // namespace detail

// ─── Save ───────────────────────────────────────────────────────────────────

bool saveNpy(const std::string& filename, const Image& image) {
  std::ofstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npy_io] Cannot create {}", filename);
    return false;
  }

  const auto header = detail::buildNpyHeader(image.shape());
  fs.write(header.data(), static_cast<std::streamsize>(header.size()));
  fs.write(reinterpret_cast<const char*>(image.data()),
           static_cast<std::streamsize>(image.size() * sizeof(float)));

  if (fs.fail()) {
    spdlog::error("[npy_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

// ─── Load ───────────────────────────────────────────────────────────────────

bool loadNpy(const std::string& filename, Image& image) {
  std::ifstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npy_io] Cannot open {}", filename);
    return false;
  }

  detail::NpyInfo info;
  if (!detail::parseNpyHeader(fs, info)) {
    spdlog::error("[npy_io] Invalid .npy header in {}", filename);
    return false;
  }
  if (info.fortran_order && info.shape.size() > 1) {
    spdlog::error("[npy_io] Fortran-order arrays are not supported ({})",
                  filename);
    return false;
  }

  // Bounded element count; checked before each multiply so it cannot wrap
  const std::size_t max_count = detail::kMaxDataBytes / info.item_size;
  std::size_t count = 1;
  for (const auto extent : info.shape) {
    const auto n = static_cast<std::size_t>(extent);
    if (n != 0 && count > max_count / n) {
      spdlog::error("[npy_io] Array too large, shape {} in {}",
                    toString(info.shape), filename);
      return false;
    }
    count *= n;
  }
  const std::size_t bytes = count * info.item_size;

  std::vector<char> raw(bytes);
  fs.read(raw.data(), static_cast<std::streamsize>(bytes));
  if (fs.fail()) {
    spdlog::error("[npy_io] Truncated data in {}", filename);
    return false;
  }

  std::vector<float> values(count);
  switch (info.dtype) {
    case detail::DType::Float32:
      detail::convert<float>(raw, values);
      break;
    case detail::DType::Float64:
      detail::convert<double>(raw, values);
      break;
    case detail::DType::UInt8:
    case detail::DType::Bool:
      detail::convert<uint8_t>(raw, values);
      break;
    case detail::DType::UInt16:
      detail::convert<uint16_t>(raw, values);
      break;
    case detail::DType::Int32:
      detail::convert<int32_t>(raw, values);
      break;
  }

  image = Image(info.shape, std::move(values));
  spdlog::debug("[npy_io] Loaded {} {}", filename, toString(image.shape()));
  return true;
}

}  // namespace io
}  // namespace volalign
