// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patch_labeling.hpp
 *
 * Connected-component labeling of a categorical raster into patches.
 * Produces a patch-id grid plus a flat patch registry (arena + indices).
 */

#ifndef LSMETRICS_PATCHES_PATCH_LABELING_HPP
#define LSMETRICS_PATCHES_PATCH_LABELING_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lsmetrics/landscape_grid.hpp"

namespace lsmetrics {

/// Cell adjacency rule used to merge same-class cells into patches.
enum class Connectivity { Four = 4, Eight = 8 };

/// Neighbor offsets for the given connectivity.
std::vector<CellOffset> neighborOffsets(Connectivity connectivity);

/// Patch-id raster; kNoPatch on nodata cells.
using LabelMatrix =
    Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

inline constexpr int32_t kNoPatch = -1;

/// Inclusive cell bounds of a patch.
struct BoundingBox {
  int row_min = 0;
  int row_max = -1;
  int col_min = 0;
  int col_max = -1;

  int rows() const { return row_max - row_min + 1; }
  int cols() const { return col_max - col_min + 1; }
  bool contains(int row, int col) const {
    return row >= row_min && row <= row_max && col >= col_min &&
           col <= col_max;
  }
};

/// Registry entry of one patch. Cell membership lives in PatchRegistry.
struct Patch {
  int32_t id = kNoPatch;
  int32_t class_code = 0;
  size_t cell_count = 0;
  BoundingBox bbox;
};

/// Read-only view over the flat cell indices (row * cols + col) of a patch.
class CellRange {
 public:
  CellRange(const int32_t* first, const int32_t* last)
      : first_(first), last_(last) {}

  const int32_t* begin() const { return first_; }
  const int32_t* end() const { return last_; }
  size_t size() const { return static_cast<size_t>(last_ - first_); }
  bool empty() const { return first_ == last_; }

 private:
  const int32_t* first_;
  const int32_t* last_;
};

/**
 * @brief Output of connected-component labeling.
 *
 * Patches are stored in a flat vector indexed by patch id, with ids assigned
 * in raster-scan order (row-major, top-to-bottom, left-to-right) of each
 * patch's first cell. The patch-id grid maps every data cell to its patch.
 * Cell membership is stored contiguously per patch (CSR layout), ascending.
 */
class PatchRegistry {
 public:
  PatchRegistry() = default;

  size_t size() const { return patches_.size(); }
  bool empty() const { return patches_.empty(); }

  const Patch& operator[](size_t id) const { return patches_[id]; }
  const std::vector<Patch>& patches() const { return patches_; }
  std::vector<Patch>::const_iterator begin() const { return patches_.begin(); }
  std::vector<Patch>::const_iterator end() const { return patches_.end(); }

  /// Patch-id grid (same shape as the labeled grid).
  const LabelMatrix& labels() const { return labels_; }

  /// Patch id at (row, col), kNoPatch for nodata.
  int32_t patchIdAt(int row, int col) const { return labels_(row, col); }

  /// Flat cell indices (row * cols + col) of a patch, ascending.
  CellRange cells(size_t id) const;

  /// Ids of all patches of a class, ascending.
  std::vector<int32_t> patchesOfClass(int32_t class_code) const;

  /// Number of columns of the labeled grid (to decode flat cell indices).
  int cols() const { return static_cast<int>(labels_.cols()); }

  Connectivity connectivity() const { return connectivity_; }

 private:
  friend class PatchLabeler;

  std::vector<Patch> patches_;
  LabelMatrix labels_;
  std::vector<size_t> cell_offsets_;  // size() + 1 entries
  std::vector<int32_t> cells_;
  Connectivity connectivity_ = Connectivity::Four;
};

/**
 * @brief Delineates patches as maximal connected same-class regions.
 *
 * Two-pass union-find with path compression. Nodata cells are never labeled
 * and never connect two regions. An all-nodata grid yields an empty registry.
 *
 * @code
 *   PatchLabeler labeler(Connectivity::Eight);
 *   PatchRegistry patches = labeler.label(grid);
 *   for (const auto& patch : patches) {
 *     // patch.id, patch.class_code, patch.cell_count, patch.bbox
 *   }
 * @endcode
 */
class PatchLabeler {
 public:
  PatchLabeler() = default;
  explicit PatchLabeler(Connectivity connectivity)
      : connectivity_(connectivity) {}

  PatchRegistry label(const LandscapeGrid& grid) const;

  Connectivity connectivity() const { return connectivity_; }

 private:
  Connectivity connectivity_ = Connectivity::Four;
};

/// Label patches of `grid` with the given connectivity.
PatchRegistry labelPatches(const LandscapeGrid& grid,
                           Connectivity connectivity = Connectivity::Four);

}  // namespace lsmetrics

#endif  // LSMETRICS_PATCHES_PATCH_LABELING_HPP
