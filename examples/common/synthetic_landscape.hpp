// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * synthetic_landscape.hpp
 *
 * Reproducible class rasters for examples.
 */

#ifndef EXAMPLES_COMMON_SYNTHETIC_LANDSCAPE_HPP
#define EXAMPLES_COMMON_SYNTHETIC_LANDSCAPE_HPP

#include <lsmetrics/landscape_grid.hpp>

#include <iostream>
#include <limits>
#include <random>
#include <vector>

namespace examples {

/// Voronoi mosaic of `num_seeds` regions drawn from `num_classes` classes,
/// with a nodata band along the last column.
inline lsmetrics::LandscapeGrid generateMosaic(int rows, int cols,
                                               int num_seeds, int num_classes,
                                               double cell_size,
                                               unsigned seed = 7) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> row_dist(0, rows - 1);
  std::uniform_int_distribution<int> col_dist(0, cols - 1);
  std::uniform_int_distribution<int> class_dist(1, num_classes);

  struct Seed {
    int row, col, code;
  };
  std::vector<Seed> seeds;
  for (int i = 0; i < num_seeds; ++i) {
    seeds.push_back({row_dist(rng), col_dist(rng), class_dist(rng)});
  }

  lsmetrics::ClassMatrix codes(rows, cols);
  lsmetrics::MaskMatrix nodata =
      lsmetrics::MaskMatrix::Constant(rows, cols, false);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      int best = std::numeric_limits<int>::max();
      for (const auto& s : seeds) {
        const int d = (s.row - r) * (s.row - r) + (s.col - c) * (s.col - c);
        if (d < best) {
          best = d;
          codes(r, c) = s.code;
        }
      }
    }
  }
  nodata.col(cols - 1).setConstant(true);
  return lsmetrics::LandscapeGrid(codes, nodata, cell_size);
}

/// Print class codes as characters ('.' for nodata).
inline void printAsciiGrid(const lsmetrics::LandscapeGrid& grid,
                           int max_cols = 60) {
  const int step = grid.cols() > max_cols ? grid.cols() / max_cols + 1 : 1;
  for (int r = 0; r < grid.rows(); r += step) {
    for (int c = 0; c < grid.cols(); c += step) {
      std::cout << (grid.isNodata(r, c)
                        ? '.'
                        : static_cast<char>('0' + grid.code(r, c) % 10));
    }
    std::cout << '\n';
  }
}

}  // namespace examples

#endif  // EXAMPLES_COMMON_SYNTHETIC_LANDSCAPE_HPP
