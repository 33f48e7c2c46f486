// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "lsmetrics/exceptions.hpp"
#include "lsmetrics/io/npz.hpp"
#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

using namespace lsmetrics;

// ─── Helpers ────────────────────────────────────────────────────────────────

namespace {

template <typename T>
std::string bytesOf(const std::vector<T>& values) {
  std::string out(values.size() * sizeof(T), '\0');
  if (!values.empty()) std::memcpy(&out[0], values.data(), out.size());
  return out;
}

void appendLE(std::string& out, uint64_t v, int bytes) {
  for (int i = 0; i < bytes; ++i) {
    out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
  }
}

/// Minimal .npy v1.0 blob.
std::string npy(const std::string& descr, const std::string& shape,
                const std::string& payload, bool fortran = false) {
  std::string dict = "{'descr': '" + descr + "', 'fortran_order': " +
                     (fortran ? "True" : "False") + ", 'shape': " + shape +
                     ", }";
  dict.push_back('\n');

  std::string out("\x93NUMPY\x01\x00", 8);
  appendLE(out, dict.size(), 2);
  return out + dict + payload;
}

std::string npyString(const std::string& text) {
  return npy("|S" + std::to_string(text.size()), "()", text);
}

std::string npyUnicode(const std::string& text) {
  std::string payload;
  for (char ch : text) appendLE(payload, static_cast<uint8_t>(ch), 4);
  return npy("<U" + std::to_string(text.size()), "()", payload);
}

struct Member {
  std::string name;
  std::string data;
  uint16_t compression = 0;
};

/// Write ZIP local entries the way numpy.savez stores them.
void writeZip(const std::string& path, const std::vector<Member>& members,
              bool zip64 = false) {
  std::string out;
  for (const auto& m : members) {
    appendLE(out, 0x04034b50, 4);
    appendLE(out, zip64 ? 45 : 20, 2);
    appendLE(out, 0, 2);  // flags
    appendLE(out, m.compression, 2);
    appendLE(out, 0, 4);  // time, date
    appendLE(out, 0, 4);  // crc (not checked)
    const uint64_t size = m.data.size();
    appendLE(out, zip64 ? 0xFFFFFFFFu : size, 4);
    appendLE(out, zip64 ? 0xFFFFFFFFu : size, 4);
    appendLE(out, m.name.size(), 2);
    appendLE(out, zip64 ? 20 : 0, 2);
    out += m.name;
    if (zip64) {
      appendLE(out, 0x0001, 2);
      appendLE(out, 16, 2);
      appendLE(out, size, 8);
      appendLE(out, size, 8);
    }
    out += m.data;
  }
  std::ofstream fs(path, std::ios::binary);
  fs.write(out.data(), static_cast<std::streamsize>(out.size()));
}

}  // namespace

class NpzTest : public ::testing::Test {
 protected:
  std::string tmp_path;

  void SetUp() override { tmp_path = testing::TempDir() + "/test_grid.npz"; }

  void TearDown() override { std::remove(tmp_path.c_str()); }
};

// ─── Round trip ─────────────────────────────────────────────────────────────

TEST_F(NpzTest, GridRoundTrip) {
  ClassMatrix codes(3, 4);
  codes << 1, 2, 2, 3,  //
      1, 1, 2, 3,       //
      4, 4, 4, 3;
  MaskMatrix nodata = MaskMatrix::Constant(3, 4, false);
  nodata(0, 3) = true;
  nodata(2, 0) = true;
  LandscapeGrid grid(codes, nodata, 30.0, 1.0);

  ASSERT_TRUE(io::saveGridNpz(tmp_path, grid));
  auto loaded = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(loaded.has_value());

  EXPECT_EQ(loaded->rows(), 3);
  EXPECT_EQ(loaded->cols(), 4);
  EXPECT_DOUBLE_EQ(loaded->cellSize(), 30.0);
  EXPECT_DOUBLE_EQ(loaded->areaUnitScale(), 1.0);
  EXPECT_EQ(loaded->codes(), codes);
  EXPECT_EQ(loaded->nodataMask(), nodata);
  EXPECT_EQ(loaded->dataCellCount(), 10u);
}

TEST_F(NpzTest, PatchIdsRoundTrip) {
  ClassMatrix codes(2, 3);
  codes << 1, 1, 2,  //
      -1, 2, 2;
  LandscapeGrid grid = LandscapeGrid::withNodataValue(codes, -1, 1.0);
  PatchRegistry patches = labelPatches(grid);

  ASSERT_TRUE(io::savePatchIdsNpz(tmp_path, grid, patches));
  auto ids = io::loadPatchIdsNpz(tmp_path);
  ASSERT_TRUE(ids.has_value());
  EXPECT_EQ(*ids, patches.labels());
  EXPECT_EQ((*ids)(1, 0), kNoPatch);

  // No class raster in a patch-id archive
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());
}

TEST_F(NpzTest, PatchIdsShapeMismatchRejected) {
  LandscapeGrid small =
      LandscapeGrid::withoutNodata(ClassMatrix::Constant(2, 2, 1), 1.0);
  LandscapeGrid large =
      LandscapeGrid::withoutNodata(ClassMatrix::Constant(3, 3, 1), 1.0);
  PatchRegistry patches = labelPatches(large);

  EXPECT_FALSE(io::savePatchIdsNpz(tmp_path, small, patches));
}

// ─── NumPy dtypes ───────────────────────────────────────────────────────────

TEST_F(NpzTest, FloatNaNIsNodata) {
  const float nan = std::numeric_limits<float>::quiet_NaN();
  writeZip(tmp_path,
           {{"class.npy",
             npy("<f4", "(2, 2)", bytesOf<float>({1.0f, nan, 2.4f, 2.6f}))}});

  auto grid = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(grid.has_value());
  EXPECT_DOUBLE_EQ(grid->cellSize(), 1.0);
  EXPECT_TRUE(grid->isNodata(0, 1));
  EXPECT_EQ(grid->code(0, 0), 1);
  EXPECT_EQ(grid->code(1, 0), 2);
  EXPECT_EQ(grid->code(1, 1), 3);
  EXPECT_EQ(grid->dataCellCount(), 3u);
}

TEST_F(NpzTest, Uint8WithNodataMask) {
  writeZip(tmp_path,
           {{"class.npy", npy("|u1", "(2, 3)",
                              bytesOf<uint8_t>({10, 20, 200, 10, 10, 20}))},
            {"nodata.npy",
             npy("|b1", "(2, 3)", bytesOf<uint8_t>({0, 0, 1, 0, 0, 0}))}});

  auto grid = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(grid.has_value());
  EXPECT_EQ(grid->code(0, 2), 200);
  EXPECT_TRUE(grid->isNodata(0, 2));
  EXPECT_EQ(grid->classCodes(), (std::vector<int32_t>{10, 20}));
}

TEST_F(NpzTest, FortranOrder) {
  // Column-major storage of [[1, 2, 3], [4, 5, 6]]
  writeZip(tmp_path,
           {{"class.npy", npy("<i4", "(2, 3)",
                              bytesOf<int32_t>({1, 4, 2, 5, 3, 6}), true)}});

  auto grid = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(grid.has_value());
  EXPECT_EQ(grid->code(0, 1), 2);
  EXPECT_EQ(grid->code(0, 2), 3);
  EXPECT_EQ(grid->code(1, 0), 4);
}

TEST_F(NpzTest, MetadataCellSizeAndNodataValue) {
  writeZip(tmp_path,
           {{"class.npy", npy("<i8", "(2, 2)",
                              bytesOf<int64_t>({5, -9999, 5, 6}))},
            {"meta.npy",
             npyString("{\"version\": 1, \"cell_size\": 30.0, "
                       "\"nodata_value\": -9999}")}});

  auto grid = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(grid.has_value());
  EXPECT_DOUBLE_EQ(grid->cellSize(), 30.0);
  EXPECT_DOUBLE_EQ(grid->areaUnitScale(), kSquareMetersToHectares);
  EXPECT_TRUE(grid->isNodata(0, 1));
  EXPECT_EQ(grid->dataCellCount(), 3u);
}

TEST_F(NpzTest, UnicodeMetadata) {
  writeZip(tmp_path,
           {{"class.npy", npy("<i2", "(1, 2)", bytesOf<int16_t>({1, 2}))},
            {"meta.npy",
             npyUnicode("{\"cell_size\": 2.5, \"area_unit_scale\": 1}")}});

  auto grid = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(grid.has_value());
  EXPECT_DOUBLE_EQ(grid->cellSize(), 2.5);
  EXPECT_DOUBLE_EQ(grid->areaUnitScale(), 1.0);
}

TEST_F(NpzTest, Zip64LocalHeaders) {
  writeZip(tmp_path,
           {{"class.npy", npy("<i4", "(1, 3)", bytesOf<int32_t>({7, 7, 8}))}},
           true);

  auto grid = io::loadGridNpz(tmp_path);
  ASSERT_TRUE(grid.has_value());
  EXPECT_EQ(grid->code(0, 2), 8);
}

// ─── Errors ─────────────────────────────────────────────────────────────────

TEST_F(NpzTest, MissingFileReturnsNullopt) {
  EXPECT_FALSE(io::loadGridNpz("/nonexistent/grid.npz").has_value());
  EXPECT_FALSE(io::loadPatchIdsNpz("/nonexistent/ids.npz").has_value());
}

TEST_F(NpzTest, MissingClassEntry) {
  writeZip(tmp_path, {{"other.npy", npy("<i4", "(1, 1)",
                                        bytesOf<int32_t>({1}))}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());
}

TEST_F(NpzTest, CompressedEntryRejected) {
  writeZip(tmp_path, {{"class.npy",
                       npy("<i4", "(1, 1)", bytesOf<int32_t>({1})), 8}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());
}

TEST_F(NpzTest, UnsupportedLayoutsRejected) {
  writeZip(tmp_path, {{"class.npy",
                       npy(">i4", "(1, 1)", bytesOf<int32_t>({1}))}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());

  writeZip(tmp_path, {{"class.npy",
                       npy("<i4", "(3,)", bytesOf<int32_t>({1, 2, 3}))}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());

  // Truncated payload
  writeZip(tmp_path, {{"class.npy",
                       npy("<i4", "(2, 2)", bytesOf<int32_t>({1, 2, 3}))}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());
}

TEST_F(NpzTest, OverflowingShapeRejected) {
  // rows * cols * 8 wraps to 64 bytes in 64-bit arithmetic
  writeZip(tmp_path,
           {{"class.npy", npy("<i8", "(2147352580, 1073807362)",
                              bytesOf<int64_t>({1, 2, 3, 4, 5, 6, 7, 8}))}});

  std::optional<LandscapeGrid> grid;
  ASSERT_NO_THROW(grid = io::loadGridNpz(tmp_path));
  EXPECT_FALSE(grid.has_value());
}

TEST_F(NpzTest, NewerMetadataVersionRejected) {
  writeZip(tmp_path,
           {{"class.npy", npy("<i4", "(1, 1)", bytesOf<int32_t>({1}))},
            {"meta.npy", npyString("{\"version\": 99, \"cell_size\": 1}")}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());
}

TEST_F(NpzTest, OutOfRangeFloatCodeRejected) {
  writeZip(tmp_path,
           {{"class.npy", npy("<f8", "(1, 1)", bytesOf<double>({1e12}))}});
  EXPECT_FALSE(io::loadGridNpz(tmp_path).has_value());
}

TEST_F(NpzTest, InvalidGridPropagates) {
  writeZip(tmp_path, {{"class.npy", npy("<i4", "(0, 3)", "")}});
  EXPECT_THROW(io::loadGridNpz(tmp_path), InvalidGridError);

  writeZip(tmp_path,
           {{"class.npy", npy("<i4", "(1, 1)", bytesOf<int32_t>({1}))},
            {"meta.npy", npyString("{\"cell_size\": 0}")}});
  EXPECT_THROW(io::loadGridNpz(tmp_path), InvalidGridError);
}
