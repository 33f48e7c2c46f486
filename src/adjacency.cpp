// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "lsmetrics/metrics/adjacency.hpp"

#include <cmath>

namespace lsmetrics {

namespace {

// Largest n with n * n <= cells.
size_t floorSqrt(size_t cells) {
  auto n = static_cast<size_t>(std::sqrt(static_cast<double>(cells)));
  while (n * n > cells) --n;
  while ((n + 1) * (n + 1) <= cells) ++n;
  return n;
}

}  // namespace

std::map<int32_t, ClassAdjacency> countAdjacencies(const LandscapeGrid& grid) {
  std::map<int32_t, ClassAdjacency> tallies;
  const int rows = grid.rows();
  const int cols = grid.cols();

  for (int row = 0; row < rows; ++row) {
    for (int col = 0; col < cols; ++col) {
      if (grid.isNodata(row, col)) continue;
      const int32_t code = grid.code(row, col);
      auto& t = tallies[code];
      t.cells++;

      for (const auto& [dr, dc] : kEdgeNeighbors) {
        const int nr = row + dr;
        const int nc = col + dc;
        if (!grid.isData(nr, nc)) {
          t.boundary++;
        } else if (grid.code(nr, nc) != code) {
          t.unlike++;
        } else if (dr > 0 || dc > 0) {
          // Like pairs are counted from the upper/left cell only
          t.like++;
        }
      }
    }
  }
  return tallies;
}

size_t maxLikeAdjacencies(size_t cells) {
  if (cells == 0) return 0;
  const size_t n = floorSqrt(cells);
  const size_t m = cells - n * n;
  const size_t full = 2 * n * (n - 1);
  if (m == 0) return full;
  if (m <= n) return full + 2 * m - 1;
  return full + 2 * m - 2;
}

size_t minPerimeterSides(size_t cells) {
  if (cells == 0) return 0;
  const size_t n = floorSqrt(cells);
  if (n * n == cells) return 4 * n;
  if (cells <= n * (n + 1)) return 4 * n + 2;
  return 4 * n + 4;
}

}  // namespace lsmetrics
