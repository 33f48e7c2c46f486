// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_npz.cpp
 *
 * Minimal ZIP (STORE) + .npy codec for class rasters and patch-id grids.
 */

#include "lsmetrics/io/npz.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lsmetrics {
namespace io {

namespace detail {

// ─── CRC32 ──────────────────────────────────────────────────────────────────

constexpr std::array<uint32_t, 256> buildCrc32Table() {
  std::array<uint32_t, 256> table{};
  for (uint32_t i = 0; i < 256; ++i) {
    uint32_t c = i;
    for (int j = 0; j < 8; ++j) {
      c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
    }
    table[i] = c;
  }
  return table;
}

static constexpr auto crc32Table = buildCrc32Table();

uint32_t crc32(const void* data, size_t len) {
  const auto* buf = static_cast<const uint8_t*>(data);
  uint32_t crc = 0xFFFFFFFFu;
  for (size_t i = 0; i < len; ++i) {
    crc = crc32Table[(crc ^ buf[i]) & 0xFF] ^ (crc >> 8);
  }
  return crc ^ 0xFFFFFFFFu;
}

// ─── Little-endian helpers ──────────────────────────────────────────────────

void writeLE16(std::ostream& os, uint16_t v) {
  os.put(static_cast<char>(v & 0xFF));
  os.put(static_cast<char>((v >> 8) & 0xFF));
}

void writeLE32(std::ostream& os, uint32_t v) {
  for (int shift = 0; shift < 32; shift += 8) {
    os.put(static_cast<char>((v >> shift) & 0xFF));
  }
}

uint16_t readLE16(std::istream& is) {
  uint8_t b[2] = {0, 0};
  is.read(reinterpret_cast<char*>(b), 2);
  return static_cast<uint16_t>(b[0] | (b[1] << 8));
}

uint32_t readLE32(std::istream& is) {
  uint8_t b[4] = {0, 0, 0, 0};
  is.read(reinterpret_cast<char*>(b), 4);
  return static_cast<uint32_t>(b[0]) | (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

uint64_t readLE64(const uint8_t* b) {
  uint64_t v = 0;
  for (int i = 7; i >= 0; --i) v = (v << 8) | b[i];
  return v;
}

// ─── ZIP STORE writer ───────────────────────────────────────────────────────

struct ZipEntry {
  std::string name;
  uint32_t crc;
  uint32_t size;
  uint32_t offset;  // offset of local file header
};

void writeLocalHeader(std::ostream& os, const ZipEntry& e) {
  writeLE32(os, 0x04034b50);                           // signature
  writeLE16(os, 20);                                   // version needed
  writeLE16(os, 0);                                    // flags
  writeLE16(os, 0);                                    // compression: STORE
  writeLE16(os, 0);                                    // mod time
  writeLE16(os, 0);                                    // mod date
  writeLE32(os, e.crc);                                // CRC-32
  writeLE32(os, e.size);                               // compressed size
  writeLE32(os, e.size);                               // uncompressed size
  writeLE16(os, static_cast<uint16_t>(e.name.size())); // filename length
  writeLE16(os, 0);                                    // extra field length
  os.write(e.name.data(), e.name.size());
}

void writeCentralHeader(std::ostream& os, const ZipEntry& e) {
  writeLE32(os, 0x02014b50);                           // signature
  writeLE16(os, 20);                                   // version made by
  writeLE16(os, 20);                                   // version needed
  writeLE16(os, 0);                                    // flags
  writeLE16(os, 0);                                    // compression: STORE
  writeLE16(os, 0);                                    // mod time
  writeLE16(os, 0);                                    // mod date
  writeLE32(os, e.crc);                                // CRC-32
  writeLE32(os, e.size);                               // compressed size
  writeLE32(os, e.size);                               // uncompressed size
  writeLE16(os, static_cast<uint16_t>(e.name.size())); // filename length
  writeLE16(os, 0);                                    // extra field length
  writeLE16(os, 0);                                    // comment length
  writeLE16(os, 0);                                    // disk number
  writeLE16(os, 0);                                    // internal attrs
  writeLE32(os, 0);                                    // external attrs
  writeLE32(os, e.offset);                             // local header offset
  os.write(e.name.data(), e.name.size());
}

void writeEndOfCentralDir(std::ostream& os, uint16_t count, uint32_t cd_size,
                          uint32_t cd_offset) {
  writeLE32(os, 0x06054b50);  // signature
  writeLE16(os, 0);           // disk number
  writeLE16(os, 0);           // disk with central dir
  writeLE16(os, count);       // entries on this disk
  writeLE16(os, count);       // total entries
  writeLE32(os, cd_size);     // central dir size
  writeLE32(os, cd_offset);   // central dir offset
  writeLE16(os, 0);           // comment length
}

using NamedBlob = std::pair<std::string, std::vector<char>>;

bool writeArchive(const std::string& filename,
                  const std::vector<NamedBlob>& blobs) {
  std::ofstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot create {}", filename);
    return false;
  }

  std::vector<ZipEntry> entries;
  for (const auto& [name, npy] : blobs) {
    ZipEntry e;
    e.name = name;
    e.crc = crc32(npy.data(), npy.size());
    e.size = static_cast<uint32_t>(npy.size());
    e.offset = static_cast<uint32_t>(fs.tellp());
    writeLocalHeader(fs, e);
    fs.write(npy.data(), npy.size());
    entries.push_back(std::move(e));
  }

  // Central directory
  const auto cd_offset = static_cast<uint32_t>(fs.tellp());
  for (const auto& e : entries) {
    writeCentralHeader(fs, e);
  }
  const uint32_t cd_size = static_cast<uint32_t>(fs.tellp()) - cd_offset;
  writeEndOfCentralDir(fs, static_cast<uint16_t>(entries.size()), cd_size,
                       cd_offset);

  if (fs.fail()) {
    spdlog::error("[npz_io] Write failed for {}", filename);
    return false;
  }
  return true;
}

// ─── NumPy .npy format ──────────────────────────────────────────────────────

std::vector<char> buildNpy(const std::string& descr, const std::string& shape,
                           const char* data, size_t data_bytes) {
  std::string dict = "{'descr': '" + descr +
                     "', 'fortran_order': False, 'shape': " + shape + ", }";

  // Pad to 64-byte alignment
  const size_t prefix_len = 10;  // 6 (magic) + 2 (version) + 2 (header_len)
  size_t padding = 64 - ((prefix_len + dict.size() + 1) % 64);
  if (padding == 64) padding = 0;
  dict.append(padding, ' ');
  dict.push_back('\n');

  const auto header_len = static_cast<uint16_t>(dict.size());

  std::vector<char> buf;
  buf.reserve(prefix_len + header_len + data_bytes);

  const char magic[] = {'\x93', 'N', 'U', 'M', 'P', 'Y', '\x01', '\x00'};
  buf.insert(buf.end(), magic, magic + 8);
  buf.push_back(static_cast<char>(header_len & 0xFF));
  buf.push_back(static_cast<char>((header_len >> 8) & 0xFF));

  buf.insert(buf.end(), dict.begin(), dict.end());
  buf.insert(buf.end(), data, data + data_bytes);
  return buf;
}

std::string matrixShape(int rows, int cols) {
  return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
}

// Row-major int32 raster as '<i4'
std::vector<char> buildInt32Npy(const ClassMatrix& m) {
  return buildNpy("<i4", matrixShape(m.rows(), m.cols()),
                  reinterpret_cast<const char*>(m.data()),
                  static_cast<size_t>(m.size()) * sizeof(int32_t));
}

std::vector<char> buildMaskNpy(const MaskMatrix& m) {
  std::vector<char> bytes(static_cast<size_t>(m.size()));
  for (Eigen::Index i = 0; i < m.size(); ++i) {
    bytes[i] = m.data()[i] ? 1 : 0;
  }
  return buildNpy("|b1", matrixShape(m.rows(), m.cols()), bytes.data(),
                  bytes.size());
}

std::vector<char> buildNpyString(const std::string& str) {
  return buildNpy("|S" + std::to_string(str.size()), "()", str.data(),
                  str.size());
}

constexpr int kMetadataVersion = 1;

std::string buildMetadataJson(const LandscapeGrid& grid) {
  return fmt::format(
      "{{\"version\": {}, \"cell_size\": {}, \"area_unit_scale\": {}, "
      "\"rows\": {}, \"cols\": {}}}",
      kMetadataVersion, grid.cellSize(), grid.areaUnitScale(), grid.rows(),
      grid.cols());
}

// ─── Metadata JSON parser (minimal) ────────────────────────────────────────

// Extract a numeric value after "key": from JSON string.
bool jsonNumber(const std::string& json, const std::string& key, double& out) {
  auto pos = json.find("\"" + key + "\"");
  if (pos == std::string::npos) return false;
  pos = json.find(':', pos);
  if (pos == std::string::npos) return false;
  try {
    out = std::stod(json.substr(pos + 1));
  } catch (const std::exception&) {
    return false;  // null or non-numeric
  }
  return true;
}

// ─── .npy header parser ────────────────────────────────────────────────────

enum class DType { Bool, U8, I8, I16, U16, I32, I64, F32, F64, Bytes, Unicode };

struct NpyInfo {
  DType dtype = DType::F32;
  size_t item_size = 0;
  bool fortran_order = false;
  std::vector<int64_t> shape;
  size_t data_offset = 0;  // offset to data within .npy blob

  bool isNumeric() const {
    return dtype != DType::Bytes && dtype != DType::Unicode;
  }
  bool isFloat() const { return dtype == DType::F32 || dtype == DType::F64; }
};

bool parseDescr(const std::string& descr, NpyInfo& info) {
  if (descr.size() < 3) return false;
  const char order = descr[0];
  if (order == '>') return false;  // big-endian data is not supported
  if (order != '<' && order != '|' && order != '=') return false;

  const char kind = descr[1];
  size_t size = 0;
  try {
    size = std::stoul(descr.substr(2));
  } catch (const std::exception&) {
    return false;
  }

  info.item_size = size;
  if (kind == 'b' && size == 1) {
    info.dtype = DType::Bool;
  } else if (kind == 'u' && size == 1) {
    info.dtype = DType::U8;
  } else if (kind == 'u' && size == 2) {
    info.dtype = DType::U16;
  } else if (kind == 'i' && size == 1) {
    info.dtype = DType::I8;
  } else if (kind == 'i' && size == 2) {
    info.dtype = DType::I16;
  } else if (kind == 'i' && size == 4) {
    info.dtype = DType::I32;
  } else if (kind == 'i' && size == 8) {
    info.dtype = DType::I64;
  } else if (kind == 'f' && size == 4) {
    info.dtype = DType::F32;
  } else if (kind == 'f' && size == 8) {
    info.dtype = DType::F64;
  } else if (kind == 'S') {
    info.dtype = DType::Bytes;
  } else if (kind == 'U') {
    info.dtype = DType::Unicode;
    info.item_size = 4 * size;  // UTF-32 code units
  } else {
    return false;
  }
  return true;
}

bool parseNpyHeader(const char* buf, size_t buf_size, NpyInfo& info) {
  // Validate magic: \x93NUMPY
  if (buf_size < 10) return false;
  if (buf[0] != '\x93' || buf[1] != 'N' || buf[2] != 'U' || buf[3] != 'M' ||
      buf[4] != 'P' || buf[5] != 'Y') {
    return false;
  }

  // Version 1.x: 2-byte header length, 2.x/3.x: 4-byte
  const auto* ubuf = reinterpret_cast<const uint8_t*>(buf);
  size_t prefix_len = 10;
  size_t header_len = ubuf[8] | (ubuf[9] << 8);
  if (ubuf[6] >= 2) {
    if (buf_size < 12) return false;
    prefix_len = 12;
    header_len = static_cast<size_t>(ubuf[8]) |
                 (static_cast<size_t>(ubuf[9]) << 8) |
                 (static_cast<size_t>(ubuf[10]) << 16) |
                 (static_cast<size_t>(ubuf[11]) << 24);
  }
  info.data_offset = prefix_len + header_len;
  if (info.data_offset > buf_size) return false;

  const std::string dict(buf + prefix_len, header_len);

  // descr
  auto pos = dict.find("'descr'");
  if (pos == std::string::npos) return false;
  pos = dict.find(':', pos);
  const auto q1 = dict.find('\'', pos + 1);
  if (pos == std::string::npos || q1 == std::string::npos) return false;
  const auto q2 = dict.find('\'', q1 + 1);
  if (q2 == std::string::npos) return false;
  if (!parseDescr(dict.substr(q1 + 1, q2 - q1 - 1), info)) return false;

  // fortran_order
  pos = dict.find("'fortran_order'");
  if (pos != std::string::npos) {
    const auto value = dict.find_first_not_of(" :", pos + 15);
    info.fortran_order =
        value != std::string::npos && dict.compare(value, 4, "True") == 0;
  }

  // shape: "()", "(3,)" or "(200, 100)"
  pos = dict.find("'shape'");
  if (pos == std::string::npos) return false;
  const auto paren = dict.find('(', pos);
  if (paren == std::string::npos) return false;
  const auto paren_end = dict.find(')', paren);
  if (paren_end == std::string::npos) return false;

  info.shape.clear();
  std::stringstream shape_str(dict.substr(paren + 1, paren_end - paren - 1));
  std::string dim;
  while (std::getline(shape_str, dim, ',')) {
    const auto first = dim.find_first_not_of(' ');
    if (first == std::string::npos) continue;  // trailing comma
    try {
      info.shape.push_back(std::stoll(dim.substr(first)));
    } catch (const std::exception&) {
      return false;
    }
  }
  return true;
}

template <typename T>
T readRaw(const char* p) {
  T v;
  std::memcpy(&v, p, sizeof(T));
  return v;
}

double elementAsDouble(DType dtype, const char* p) {
  switch (dtype) {
    case DType::Bool:
    case DType::U8: return static_cast<double>(readRaw<uint8_t>(p));
    case DType::I8: return static_cast<double>(readRaw<int8_t>(p));
    case DType::I16: return static_cast<double>(readRaw<int16_t>(p));
    case DType::U16: return static_cast<double>(readRaw<uint16_t>(p));
    case DType::I32: return static_cast<double>(readRaw<int32_t>(p));
    case DType::I64: return static_cast<double>(readRaw<int64_t>(p));
    case DType::F32: return static_cast<double>(readRaw<float>(p));
    case DType::F64: return readRaw<double>(p);
    default: return std::numeric_limits<double>::quiet_NaN();
  }
}

// Offset of element (r, c) in the data block.
size_t elementOffset(const NpyInfo& info, int r, int c) {
  const auto rows = static_cast<size_t>(info.shape[0]);
  const auto cols = static_cast<size_t>(info.shape[1]);
  const size_t index = info.fortran_order ? c * rows + r : r * cols + c;
  return info.data_offset + index * info.item_size;
}

bool checkMatrix(const std::string& name, const NpyInfo& info,
                 size_t blob_size) {
  if (!info.isNumeric() || info.shape.size() != 2 || info.shape[0] < 0 ||
      info.shape[1] < 0 ||
      info.shape[0] > std::numeric_limits<int>::max() ||
      info.shape[1] > std::numeric_limits<int>::max()) {
    spdlog::error("[npz_io] '{}' must be a 2-D numeric array", name);
    return false;
  }
  const size_t rows = static_cast<size_t>(info.shape[0]);
  const size_t cols = static_cast<size_t>(info.shape[1]);
  constexpr size_t kMaxSize = std::numeric_limits<size_t>::max();
  if (info.item_size == 0 ||
      (rows != 0 && cols > kMaxSize / rows / info.item_size)) {
    spdlog::error("[npz_io] Shape of '{}' overflows the addressable size",
                  name);
    return false;
  }
  const size_t bytes = rows * cols * info.item_size;
  if (info.data_offset > blob_size || bytes > blob_size - info.data_offset) {
    spdlog::error("[npz_io] Truncated data for '{}'", name);
    return false;
  }
  return true;
}

// Decode class codes; NaN cells are flagged in `nan_cells`.
bool decodeClassArray(const NpyInfo& info, const std::vector<char>& blob,
                      ClassMatrix& codes, MaskMatrix& nan_cells) {
  if (!checkMatrix("class.npy", info, blob.size())) return false;
  const int rows = static_cast<int>(info.shape[0]);
  const int cols = static_cast<int>(info.shape[1]);

  codes.resize(rows, cols);
  nan_cells = MaskMatrix::Constant(rows, cols, false);
  constexpr double kMin = std::numeric_limits<int32_t>::min();
  constexpr double kMax = std::numeric_limits<int32_t>::max();

  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      const char* p = blob.data() + elementOffset(info, r, c);
      double v = elementAsDouble(info.dtype, p);
      if (std::isnan(v)) {
        nan_cells(r, c) = true;
        codes(r, c) = 0;
        continue;
      }
      if (info.isFloat()) v = std::round(v);
      if (v < kMin || v > kMax) {
        spdlog::error("[npz_io] Class code {} at ({}, {}) exceeds int32 range",
                      v, r, c);
        return false;
      }
      codes(r, c) = static_cast<int32_t>(v);
    }
  }
  return true;
}

bool decodeMaskArray(const NpyInfo& info, const std::vector<char>& blob,
                     int rows, int cols, MaskMatrix& mask) {
  if (!checkMatrix("nodata.npy", info, blob.size())) return false;
  if (info.dtype != DType::Bool && info.dtype != DType::U8) {
    spdlog::error("[npz_io] 'nodata.npy' must be |b1 or |u1");
    return false;
  }
  if (info.shape[0] != rows || info.shape[1] != cols) {
    spdlog::error("[npz_io] Shape mismatch for nodata mask: ({}x{}) vs ({}x{})",
                  info.shape[0], info.shape[1], rows, cols);
    return false;
  }

  mask.resize(rows, cols);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      mask(r, c) = blob[elementOffset(info, r, c)] != 0;
    }
  }
  return true;
}

bool decodeString(const NpyInfo& info, const std::vector<char>& blob,
                  std::string& out) {
  if (info.dtype != DType::Bytes && info.dtype != DType::Unicode) return false;
  if (info.data_offset + info.item_size > blob.size()) return false;

  const char* data = blob.data() + info.data_offset;
  out.clear();
  if (info.dtype == DType::Bytes) {
    out.assign(data, info.item_size);
  } else {
    // UTF-32LE; metadata is ASCII
    for (size_t i = 0; i + 4 <= info.item_size; i += 4) {
      const auto cp = readRaw<uint32_t>(data + i);
      out.push_back(cp < 128 ? static_cast<char>(cp) : '?');
    }
  }
  // NumPy pads fixed-width strings with NULs
  const auto end = out.find('\0');
  if (end != std::string::npos) out.resize(end);
  return true;
}

// ─── ZIP reader ─────────────────────────────────────────────────────────────

struct Entry {
  std::string name;
  std::vector<char> data;
};

bool readArchive(const std::string& filename, std::vector<Entry>& entries) {
  std::ifstream fs(filename, std::ios::binary);
  if (!fs.is_open()) {
    spdlog::error("[npz_io] Cannot open {}", filename);
    return false;
  }

  constexpr uint32_t kLocalSig = 0x04034b50;
  constexpr uint32_t kMaxEntries = 1000;
  constexpr uint64_t kMaxEntrySize = 400'000'000;  // 400MB
  constexpr uint32_t kZip64Marker = 0xFFFFFFFFu;

  while (entries.size() < kMaxEntries) {
    const uint32_t sig = readLE32(fs);
    if (fs.fail() || sig != kLocalSig) break;

    fs.ignore(2);  // version needed
    const uint16_t flags = readLE16(fs);
    const uint16_t compression = readLE16(fs);
    fs.ignore(8);  // time, date, crc
    uint64_t compressed_size = readLE32(fs);
    uint64_t uncompressed_size = readLE32(fs);
    const uint16_t name_len = readLE16(fs);
    const uint16_t extra_len = readLE16(fs);
    if (fs.fail()) break;

    std::string name(name_len, '\0');
    fs.read(&name[0], name_len);
    std::vector<uint8_t> extra(extra_len);
    fs.read(reinterpret_cast<char*>(extra.data()), extra_len);
    if (fs.fail()) {
      spdlog::error("[npz_io] Truncated header in {}", filename);
      return false;
    }

    // numpy.savez writes ZIP64 local headers: sizes live in extra field 0x0001
    if (uncompressed_size == kZip64Marker || compressed_size == kZip64Marker) {
      for (size_t p = 0; p + 4 <= extra.size();) {
        const auto id = static_cast<uint16_t>(extra[p] | (extra[p + 1] << 8));
        const auto len =
            static_cast<uint16_t>(extra[p + 2] | (extra[p + 3] << 8));
        if (id == 0x0001) {
          size_t q = p + 4;
          if (uncompressed_size == kZip64Marker && q + 8 <= extra.size()) {
            uncompressed_size = readLE64(&extra[q]);
            q += 8;
          }
          if (compressed_size == kZip64Marker && q + 8 <= extra.size()) {
            compressed_size = readLE64(&extra[q]);
          }
          break;
        }
        p += 4 + len;
      }
    }

    if (compression != 0) {
      spdlog::error(
          "[npz_io] Entry '{}' is compressed; save with numpy.savez, not "
          "savez_compressed",
          name);
      return false;
    }
    if ((flags & 0x08) && uncompressed_size == 0) {
      spdlog::error("[npz_io] Streamed entry '{}' is not supported", name);
      return false;
    }
    if (uncompressed_size > kMaxEntrySize ||
        compressed_size != uncompressed_size) {
      spdlog::error("[npz_io] Invalid entry '{}' (size={})", name,
                    uncompressed_size);
      return false;
    }

    std::vector<char> data(static_cast<size_t>(uncompressed_size));
    fs.read(data.data(), static_cast<std::streamsize>(data.size()));
    if (fs.fail()) {
      spdlog::error("[npz_io] Truncated data for entry '{}'", name);
      return false;
    }

    entries.push_back({std::move(name), std::move(data)});
  }

  if (entries.empty()) {
    spdlog::error("[npz_io] No entries found in {}", filename);
    return false;
  }
  return true;
}

const Entry* findEntry(const std::vector<Entry>& entries,
                       const std::string& name) {
  for (const auto& e : entries) {
    if (e.name == name) return &e;
  }
  return nullptr;
}

}  // namespace detail

// ─── Save ───────────────────────────────────────────────────────────────────

bool saveGridNpz(const std::string& filename, const LandscapeGrid& grid) {
  std::vector<detail::NamedBlob> blobs;
  blobs.emplace_back("class.npy", detail::buildInt32Npy(grid.codes()));
  blobs.emplace_back("nodata.npy", detail::buildMaskNpy(grid.nodataMask()));
  blobs.emplace_back("meta.npy",
                     detail::buildNpyString(detail::buildMetadataJson(grid)));
  return detail::writeArchive(filename, blobs);
}

bool savePatchIdsNpz(const std::string& filename, const LandscapeGrid& grid,
                     const PatchRegistry& registry) {
  if (registry.labels().rows() != grid.rows() ||
      registry.labels().cols() != grid.cols()) {
    spdlog::error("[npz_io] Patch-id grid ({}x{}) does not match grid ({}x{})",
                  registry.labels().rows(), registry.labels().cols(),
                  grid.rows(), grid.cols());
    return false;
  }

  std::vector<detail::NamedBlob> blobs;
  blobs.emplace_back("patch_id.npy", detail::buildInt32Npy(registry.labels()));
  blobs.emplace_back("meta.npy",
                     detail::buildNpyString(detail::buildMetadataJson(grid)));
  return detail::writeArchive(filename, blobs);
}

// ─── Load ───────────────────────────────────────────────────────────────────

std::optional<LandscapeGrid> loadGridNpz(const std::string& filename) {
  std::vector<detail::Entry> entries;
  if (!detail::readArchive(filename, entries)) return std::nullopt;

  // Class codes
  const auto* class_entry = detail::findEntry(entries, "class.npy");
  if (!class_entry) {
    spdlog::error("[npz_io] No class.npy entry in {}", filename);
    return std::nullopt;
  }
  detail::NpyInfo class_info;
  if (!detail::parseNpyHeader(class_entry->data.data(),
                              class_entry->data.size(), class_info)) {
    spdlog::error("[npz_io] Invalid class.npy header");
    return std::nullopt;
  }
  ClassMatrix codes;
  MaskMatrix nodata;
  if (!detail::decodeClassArray(class_info, class_entry->data, codes, nodata)) {
    return std::nullopt;
  }

  // Explicit nodata mask
  if (const auto* mask_entry = detail::findEntry(entries, "nodata.npy")) {
    detail::NpyInfo info;
    MaskMatrix mask;
    if (!detail::parseNpyHeader(mask_entry->data.data(),
                                mask_entry->data.size(), info) ||
        !detail::decodeMaskArray(info, mask_entry->data, codes.rows(),
                                 codes.cols(), mask)) {
      spdlog::error("[npz_io] Invalid nodata.npy in {}", filename);
      return std::nullopt;
    }
    nodata = (nodata.array() || mask.array()).matrix();
  }

  // Metadata
  double cell_size = 1.0;
  double area_unit_scale = kSquareMetersToHectares;
  if (const auto* meta_entry = detail::findEntry(entries, "meta.npy")) {
    detail::NpyInfo info;
    std::string json;
    if (!detail::parseNpyHeader(meta_entry->data.data(),
                                meta_entry->data.size(), info) ||
        !detail::decodeString(info, meta_entry->data, json)) {
      spdlog::error("[npz_io] Invalid meta.npy header");
      return std::nullopt;
    }

    double version = 0;
    if (detail::jsonNumber(json, "version", version) &&
        static_cast<int>(version) > detail::kMetadataVersion) {
      spdlog::error("[npz_io] Unsupported metadata version {} (max {})",
                    static_cast<int>(version), detail::kMetadataVersion);
      return std::nullopt;
    }

    if (!detail::jsonNumber(json, "cell_size", cell_size)) {
      spdlog::warn("[npz_io] No cell_size in metadata, assuming 1.0");
    }
    detail::jsonNumber(json, "area_unit_scale", area_unit_scale);

    double nodata_value = 0;
    if (detail::jsonNumber(json, "nodata_value", nodata_value)) {
      const auto sentinel = static_cast<int32_t>(std::round(nodata_value));
      nodata = (nodata.array() || codes.cwiseEqual(sentinel).array()).matrix();
    }
  } else {
    spdlog::warn("[npz_io] No meta.npy in {}, assuming cell_size 1.0",
                 filename);
  }

  spdlog::debug("[npz_io] Loaded {}x{} grid from {} (cell size {})",
                codes.rows(), codes.cols(), filename, cell_size);
  return LandscapeGrid(std::move(codes), std::move(nodata), cell_size,
                       area_unit_scale);
}

std::optional<LabelMatrix> loadPatchIdsNpz(const std::string& filename) {
  std::vector<detail::Entry> entries;
  if (!detail::readArchive(filename, entries)) return std::nullopt;

  const auto* entry = detail::findEntry(entries, "patch_id.npy");
  if (!entry) {
    spdlog::error("[npz_io] No patch_id.npy entry in {}", filename);
    return std::nullopt;
  }
  detail::NpyInfo info;
  if (!detail::parseNpyHeader(entry->data.data(), entry->data.size(), info) ||
      info.isFloat()) {
    spdlog::error("[npz_io] patch_id.npy must be an integer array");
    return std::nullopt;
  }
  LabelMatrix labels;
  MaskMatrix unused;
  if (!detail::decodeClassArray(info, entry->data, labels, unused)) {
    return std::nullopt;
  }
  return labels;
}

}  // namespace io
}  // namespace lsmetrics
