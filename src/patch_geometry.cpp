// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * patch_geometry.cpp
 *
 * Boundary-edge counting, erosion-based core extraction and shape
 * descriptors of labeled patches.
 */

#include "lsmetrics/patches/patch_geometry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <random>

namespace lsmetrics {

namespace {

// Bounding-box local bitmap helpers
struct LocalFrame {
  int row0, col0, rows, cols;

  bool contains(int lr, int lc) const {
    return lr >= 0 && lr < rows && lc >= 0 && lc < cols;
  }
  int index(int lr, int lc) const { return lr * cols + lc; }
};

LocalFrame frameOf(const Patch& patch) {
  return {patch.bbox.row_min, patch.bbox.col_min, patch.bbox.rows(),
          patch.bbox.cols()};
}

double cross(const Eigen::Vector2d& o, const Eigen::Vector2d& a,
             const Eigen::Vector2d& b) {
  return (a.x() - o.x()) * (b.y() - o.y()) - (a.y() - o.y()) * (b.x() - o.x());
}

// Andrew's monotone chain; returns hull vertices in counter-clockwise order.
std::vector<Eigen::Vector2d> convexHull(std::vector<Eigen::Vector2d> points) {
  auto less = [](const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
    return a.x() < b.x() || (a.x() == b.x() && a.y() < b.y());
  };
  std::sort(points.begin(), points.end(), less);
  points.erase(std::unique(points.begin(), points.end()), points.end());
  if (points.size() < 3) return points;

  std::vector<Eigen::Vector2d> hull(2 * points.size());
  size_t k = 0;
  for (size_t i = 0; i < points.size(); ++i) {
    while (k >= 2 && cross(hull[k - 2], hull[k - 1], points[i]) <= 0.0) --k;
    hull[k++] = points[i];
  }
  for (size_t i = points.size() - 1, lower = k + 1; i > 0; --i) {
    while (k >= lower && cross(hull[k - 2], hull[k - 1], points[i - 1]) <= 0.0)
      --k;
    hull[k++] = points[i - 1];
  }
  hull.resize(k - 1);
  return hull;
}

bool inside(const Circle& c, const Eigen::Vector2d& p) {
  constexpr double kRelTol = 1e-9;
  return (p - c.center).norm() <= c.radius + kRelTol * std::max(1.0, c.radius);
}

Circle circleFrom(const Eigen::Vector2d& a, const Eigen::Vector2d& b) {
  return {0.5 * (a + b), 0.5 * (a - b).norm()};
}

Circle circleFrom(const Eigen::Vector2d& a, const Eigen::Vector2d& b,
                  const Eigen::Vector2d& c) {
  const double d = 2.0 * (a.x() * (b.y() - c.y()) + b.x() * (c.y() - a.y()) +
                          c.x() * (a.y() - b.y()));
  if (std::abs(d) < 1e-12) {
    // Collinear: the widest pair spans the circle
    Circle best = circleFrom(a, b);
    for (const auto& candidate : {circleFrom(a, c), circleFrom(b, c)}) {
      if (candidate.radius > best.radius) best = candidate;
    }
    return best;
  }
  const double a2 = a.squaredNorm();
  const double b2 = b.squaredNorm();
  const double c2 = c.squaredNorm();
  Eigen::Vector2d center(
      (a2 * (b.y() - c.y()) + b2 * (c.y() - a.y()) + c2 * (a.y() - b.y())) / d,
      (a2 * (c.x() - b.x()) + b2 * (a.x() - c.x()) + c2 * (b.x() - a.x())) / d);
  return {center, (a - center).norm()};
}

}  // namespace

size_t countBoundaryEdges(const LandscapeGrid& grid,
                          const PatchRegistry& registry, size_t patch_id) {
  const int cols = registry.cols();
  const int32_t code = registry[patch_id].class_code;

  size_t edges = 0;
  for (int32_t cell : registry.cells(patch_id)) {
    const int row = cell / cols;
    const int col = cell % cols;
    for (const auto& [dr, dc] : kEdgeNeighbors) {
      const int nr = row + dr;
      const int nc = col + dc;
      if (!grid.isData(nr, nc) || grid.code(nr, nc) != code) ++edges;
    }
  }
  return edges;
}

std::vector<uint8_t> erodeCore(const PatchRegistry& registry, size_t patch_id,
                               int edge_depth) {
  const int cols = registry.cols();
  const LocalFrame frame = frameOf(registry[patch_id]);

  std::vector<uint8_t> bitmap(static_cast<size_t>(frame.rows) * frame.cols, 0);
  std::vector<int> remaining;
  remaining.reserve(registry[patch_id].cell_count);
  for (int32_t cell : registry.cells(patch_id)) {
    const int idx = frame.index(cell / cols - frame.row0,
                                cell % cols - frame.col0);
    bitmap[idx] = 1;
    remaining.push_back(idx);
  }

  // Peel one boundary layer per iteration. A neighbor outside the bounding
  // box or unset in the bitmap is not a remaining cell of this patch.
  std::vector<int> peeled;
  for (int depth = 0; depth < edge_depth && !remaining.empty(); ++depth) {
    peeled.clear();
    auto kept = remaining.begin();
    for (int idx : remaining) {
      const int lr = idx / frame.cols;
      const int lc = idx % frame.cols;
      bool boundary = false;
      for (const auto& [dr, dc] : kEdgeNeighbors) {
        const int nr = lr + dr;
        const int nc = lc + dc;
        if (!frame.contains(nr, nc) || !bitmap[frame.index(nr, nc)]) {
          boundary = true;
          break;
        }
      }
      if (boundary) {
        peeled.push_back(idx);
      } else {
        *kept++ = idx;
      }
    }
    remaining.erase(kept, remaining.end());
    for (int idx : peeled) bitmap[idx] = 0;
  }

  return bitmap;
}

int countRegions(const std::vector<uint8_t>& bitmap, int rows, int cols,
                 Connectivity connectivity) {
  const auto offsets = neighborOffsets(connectivity);
  std::vector<uint8_t> visited(bitmap.size(), 0);
  std::vector<int> stack;

  int regions = 0;
  for (int start = 0; start < static_cast<int>(bitmap.size()); ++start) {
    if (!bitmap[start] || visited[start]) continue;
    ++regions;
    visited[start] = 1;
    stack.push_back(start);

    while (!stack.empty()) {
      const int idx = stack.back();
      stack.pop_back();
      const int r = idx / cols;
      const int c = idx % cols;
      for (const auto& [dr, dc] : offsets) {
        const int nr = r + dr;
        const int nc = c + dc;
        if (nr < 0 || nr >= rows || nc < 0 || nc >= cols) continue;
        const int n = nr * cols + nc;
        if (!bitmap[n] || visited[n]) continue;
        visited[n] = 1;
        stack.push_back(n);
      }
    }
  }
  return regions;
}

Circle minimumEnclosingCircle(std::vector<Eigen::Vector2d> points) {
  if (points.empty()) return {};

  std::mt19937 rng(42);
  std::shuffle(points.begin(), points.end(), rng);

  Circle c{points[0], 0.0};
  for (size_t i = 1; i < points.size(); ++i) {
    if (inside(c, points[i])) continue;
    c = {points[i], 0.0};
    for (size_t j = 0; j < i; ++j) {
      if (inside(c, points[j])) continue;
      c = circleFrom(points[i], points[j]);
      for (size_t k = 0; k < j; ++k) {
        if (inside(c, points[k])) continue;
        c = circleFrom(points[i], points[j], points[k]);
      }
    }
  }
  return c;
}

Circle enclosingCircle(const LandscapeGrid& grid,
                       const PatchRegistry& registry, size_t patch_id) {
  const int cols = registry.cols();
  const auto& bbox = registry[patch_id].bbox;

  // Leftmost/rightmost cell per row; their corners bound every cell corner.
  const int rows = bbox.rows();
  std::vector<int> row_min(rows, bbox.col_max + 1);
  std::vector<int> row_max(rows, bbox.col_min - 1);
  for (int32_t cell : registry.cells(patch_id)) {
    const int lr = cell / cols - bbox.row_min;
    const int col = cell % cols;
    row_min[lr] = std::min(row_min[lr], col);
    row_max[lr] = std::max(row_max[lr], col);
  }

  std::vector<Eigen::Vector2d> corners;
  corners.reserve(static_cast<size_t>(rows) * 8);
  for (int lr = 0; lr < rows; ++lr) {
    if (row_min[lr] > row_max[lr]) continue;
    const double y0 = bbox.row_min + lr;
    for (double x : {static_cast<double>(row_min[lr]),
                     static_cast<double>(row_max[lr] + 1)}) {
      corners.emplace_back(x, y0);
      corners.emplace_back(x, y0 + 1.0);
    }
  }

  Circle circle = minimumEnclosingCircle(convexHull(std::move(corners)));
  circle.center *= grid.cellSize();
  circle.radius *= grid.cellSize();
  return circle;
}

PatchGeometry computePatchGeometry(const LandscapeGrid& grid,
                                   const PatchRegistry& registry,
                                   size_t patch_id,
                                   const config::CoreArea& core) {
  const Patch& patch = registry[patch_id];
  const double cell_size = grid.cellSize();

  PatchGeometry g;
  g.patch_id = patch.id;
  g.class_code = patch.class_code;
  g.cell_count = patch.cell_count;

  // Area and perimeter
  const double area_linear = static_cast<double>(patch.cell_count) *
                             grid.cellArea();
  g.edge_count = countBoundaryEdges(grid, registry, patch_id);
  g.perimeter = static_cast<double>(g.edge_count) * cell_size;
  g.area = area_linear * grid.areaUnitScale();

  // Core area
  const LocalFrame frame = frameOf(patch);
  const auto core_bitmap =
      erodeCore(registry, patch_id, std::max(0, core.edge_depth));
  g.core_cell_count = static_cast<size_t>(
      std::count(core_bitmap.begin(), core_bitmap.end(), uint8_t{1}));
  g.core_count = g.core_cell_count == 0
                     ? 0
                     : countRegions(core_bitmap, frame.rows, frame.cols,
                                    registry.connectivity());
  g.core_area = static_cast<double>(g.core_cell_count) * grid.cellAreaHa();
  g.cai = 100.0 * g.core_area / g.area;

  // Shape descriptors
  const double P = g.perimeter;
  const double A = area_linear;
  g.shape = P / (2.0 * std::sqrt(M_PI * A));
  const double log_area = std::log(A);
  g.frac = (patch.cell_count == 1 || log_area == 0.0)
               ? 1.0
               : 2.0 * std::log(0.25 * P) / log_area;
  g.para = P / A;

  const Circle circle = enclosingCircle(grid, registry, patch_id);
  const double circle_area = M_PI * circle.radius * circle.radius;
  g.circle = 1.0 - A / circle_area;

  return g;
}

std::vector<PatchGeometry> computePatchGeometry(const LandscapeGrid& grid,
                                                const PatchRegistry& registry,
                                                const config::CoreArea& core) {
  std::vector<PatchGeometry> geometry;
  geometry.reserve(registry.size());
  for (size_t id = 0; id < registry.size(); ++id) {
    geometry.push_back(computePatchGeometry(grid, registry, id, core));
  }
  spdlog::debug("[PatchGeometry] {} patches, edge depth {}", geometry.size(),
                core.edge_depth);
  return geometry;
}

}  // namespace lsmetrics
