// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patch_labeling.cpp
 *
 * Two-pass connected-component labeling with a disjoint-set forest.
 */

#include "lsmetrics/patches/patch_labeling.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <numeric>

namespace lsmetrics {

namespace detail {

// Disjoint-set forest over flat cell indices (union by size, path halving).
class DisjointSet {
 public:
  explicit DisjointSet(size_t n) : parent_(n), size_(n, 1) {
    std::iota(parent_.begin(), parent_.end(), 0);
  }

  int32_t find(int32_t i) {
    while (parent_[i] != i) {
      parent_[i] = parent_[parent_[i]];
      i = parent_[i];
    }
    return i;
  }

  void unite(int32_t a, int32_t b) {
    int32_t root_a = find(a);
    int32_t root_b = find(b);
    if (root_a == root_b) return;
    if (size_[root_a] < size_[root_b]) std::swap(root_a, root_b);
    parent_[root_b] = root_a;
    size_[root_a] += size_[root_b];
  }

 private:
  std::vector<int32_t> parent_;
  std::vector<int32_t> size_;
};

}  // namespace detail

std::vector<CellOffset> neighborOffsets(Connectivity connectivity) {
  std::vector<CellOffset> offsets(std::begin(kEdgeNeighbors),
                                  std::end(kEdgeNeighbors));
  if (connectivity == Connectivity::Eight) {
    offsets.push_back({-1, -1});
    offsets.push_back({-1, 1});
    offsets.push_back({1, -1});
    offsets.push_back({1, 1});
  }
  return offsets;
}

CellRange PatchRegistry::cells(size_t id) const {
  const int32_t* base = cells_.data();
  return CellRange(base + cell_offsets_[id], base + cell_offsets_[id + 1]);
}

std::vector<int32_t> PatchRegistry::patchesOfClass(int32_t class_code) const {
  std::vector<int32_t> ids;
  for (const auto& patch : patches_) {
    if (patch.class_code == class_code) ids.push_back(patch.id);
  }
  return ids;
}

PatchRegistry PatchLabeler::label(const LandscapeGrid& grid) const {
  const int rows = grid.rows();
  const int cols = grid.cols();
  const size_t n = grid.cellCount();

  PatchRegistry registry;
  registry.connectivity_ = connectivity_;
  registry.labels_ = LabelMatrix::Constant(rows, cols, kNoPatch);
  registry.cell_offsets_.assign(1, 0);

  if (grid.dataCellCount() == 0) {
    spdlog::debug("[PatchLabeler] Grid is entirely nodata, no patches");
    return registry;
  }

  // Already-visited neighbors in raster order
  std::vector<CellOffset> backward = {{-1, 0}, {0, -1}};
  if (connectivity_ == Connectivity::Eight) {
    backward.push_back({-1, -1});
    backward.push_back({-1, 1});
  }

  // First pass: merge each data cell with its same-class backward neighbors
  detail::DisjointSet forest(n);
  for (int row = 0; row < rows; ++row) {
    for (int col = 0; col < cols; ++col) {
      if (grid.isNodata(row, col)) continue;
      const int32_t code = grid.code(row, col);
      const int32_t index = row * cols + col;

      for (const auto& [dr, dc] : backward) {
        const int nr = row + dr;
        const int nc = col + dc;
        if (!grid.isData(nr, nc) || grid.code(nr, nc) != code) continue;
        forest.unite(index, nr * cols + nc);
      }
    }
  }

  // Second pass: dense ids in raster-scan order of each root's first cell
  std::vector<int32_t> root_to_id(n, kNoPatch);
  auto& patches = registry.patches_;
  auto& labels = registry.labels_;

  for (int row = 0; row < rows; ++row) {
    for (int col = 0; col < cols; ++col) {
      if (grid.isNodata(row, col)) continue;
      const int32_t root = forest.find(row * cols + col);

      int32_t id = root_to_id[root];
      if (id == kNoPatch) {
        id = static_cast<int32_t>(patches.size());
        root_to_id[root] = id;

        Patch patch;
        patch.id = id;
        patch.class_code = grid.code(row, col);
        patch.bbox = {row, row, col, col};
        patches.push_back(patch);
      }

      auto& patch = patches[id];
      patch.cell_count++;
      patch.bbox.row_max = row;  // raster order: rows never decrease
      patch.bbox.col_min = std::min(patch.bbox.col_min, col);
      patch.bbox.col_max = std::max(patch.bbox.col_max, col);
      labels(row, col) = id;
    }
  }

  // Cell membership (CSR): offsets by prefix sum, fill in raster order
  auto& offsets = registry.cell_offsets_;
  offsets.assign(patches.size() + 1, 0);
  for (const auto& patch : patches) {
    offsets[patch.id + 1] = offsets[patch.id] + patch.cell_count;
  }

  registry.cells_.resize(grid.dataCellCount());
  std::vector<size_t> cursor(offsets.begin(), offsets.end() - 1);
  for (int row = 0; row < rows; ++row) {
    for (int col = 0; col < cols; ++col) {
      const int32_t id = labels(row, col);
      if (id == kNoPatch) continue;
      registry.cells_[cursor[id]++] = row * cols + col;
    }
  }

  spdlog::debug("[PatchLabeler] {} patches in {}x{} grid ({}-connectivity)",
                patches.size(), rows, cols, static_cast<int>(connectivity_));
  return registry;
}

PatchRegistry labelPatches(const LandscapeGrid& grid,
                           Connectivity connectivity) {
  return PatchLabeler(connectivity).label(grid);
}

}  // namespace lsmetrics
