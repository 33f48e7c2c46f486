// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * adjacency.hpp
 *
 * Cell-adjacency tallies per class (4-neighbourhood) and the compact
 * arrangement bounds used by AI, CLUMPY and LSI.
 */

#ifndef LSMETRICS_METRICS_ADJACENCY_HPP
#define LSMETRICS_METRICS_ADJACENCY_HPP

#include <cstddef>
#include <cstdint>
#include <map>

#include "lsmetrics/landscape_grid.hpp"

namespace lsmetrics {

/// Adjacency tallies of one class.
struct ClassAdjacency {
  size_t cells = 0;
  size_t like = 0;      ///< Same-class cell pairs, each pair counted once
  size_t unlike = 0;    ///< Cell sides facing a data cell of another class
  size_t boundary = 0;  ///< Cell sides facing nodata or the grid border

  /// Class edge length in cell sides.
  size_t edgeSides() const { return unlike + boundary; }
};

/// Tally adjacencies of every class present in the grid, keyed by code.
std::map<int32_t, ClassAdjacency> countAdjacencies(const LandscapeGrid& grid);

/// Largest number of like adjacencies `cells` cells can share
/// (compact square or near-square arrangement).
size_t maxLikeAdjacencies(size_t cells);

/// Smallest possible perimeter, in cell sides, of `cells` cells.
size_t minPerimeterSides(size_t cells);

}  // namespace lsmetrics

#endif  // LSMETRICS_METRICS_ADJACENCY_HPP
