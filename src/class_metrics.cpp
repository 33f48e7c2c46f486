// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * class_metrics.cpp
 *
 * Area, edge, shape, core-area and aggregation metrics per class.
 */

#include "lsmetrics/metrics/class_metrics.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <numeric>

namespace lsmetrics {

namespace {

double meanOf(const std::vector<PatchGeometry>& geometry,
              const std::vector<int32_t>& ids,
              double PatchGeometry::*field) {
  if (ids.empty()) return kNotApplicable;
  double sum = 0.0;
  for (int32_t id : ids) sum += geometry[id].*field;
  return sum / static_cast<double>(ids.size());
}

// Aggregation index from single-count like adjacencies.
double aggregationIndex(const ClassAdjacency& adj) {
  if (adj.cells == 0) return kNotApplicable;
  const size_t max_like = maxLikeAdjacencies(adj.cells);
  if (max_like == 0) return 0.0;
  return 100.0 * static_cast<double>(adj.like) / static_cast<double>(max_like);
}

double clumpiness(const ClassAdjacency& adj, double proportion) {
  const double a = static_cast<double>(adj.cells);
  const double min_e = static_cast<double>(minPerimeterSides(adj.cells));
  const double denom = 4.0 * a - min_e;
  if (denom == 0.0 || std::isnan(proportion)) return kNotApplicable;

  const double G = 2.0 * static_cast<double>(adj.like) / denom;
  const double P = proportion;
  if (G < P) return detail::ratio(G - P, P);
  return detail::ratio(G - P, 1.0 - P);
}

// Patch cohesion; perimeter in cell sides, area in cells.
double cohesion(const std::vector<PatchGeometry>& geometry,
                const std::vector<int32_t>& ids, size_t data_cells) {
  if (ids.empty() || data_cells <= 1) return kNotApplicable;
  double perim = 0.0;
  double weighted = 0.0;
  for (int32_t id : ids) {
    const auto& g = geometry[id];
    const double p = static_cast<double>(g.edge_count);
    perim += p;
    weighted += p * std::sqrt(static_cast<double>(g.cell_count));
  }
  if (weighted == 0.0) return kNotApplicable;
  const double norm = 1.0 - 1.0 / std::sqrt(static_cast<double>(data_cells));
  return 100.0 * (1.0 - perim / weighted) / norm;
}

}  // namespace

LandscapeExtent LandscapeExtent::of(const LandscapeGrid& grid) {
  LandscapeExtent extent;
  extent.total_area = grid.dataAreaHa();
  extent.data_cells = grid.dataCellCount();
  extent.cell_size = grid.cellSize();
  extent.cell_area_ha = grid.cellAreaHa();
  return extent;
}

PatchSummary summarizePatches(const std::vector<PatchGeometry>& geometry,
                              const std::vector<int32_t>& patch_ids) {
  PatchSummary s;
  s.count = patch_ids.size();
  if (patch_ids.empty()) return s;

  double shape_weighted = 0.0;
  for (int32_t id : patch_ids) {
    const auto& g = geometry[id];
    s.area += g.area;
    s.area_sq += g.area * g.area;
    s.core_area += g.core_area;
    s.core_regions += static_cast<size_t>(g.core_count);
    shape_weighted += g.shape * g.area;
  }

  // Population standard deviation of patch areas
  const double mean = s.area / static_cast<double>(s.count);
  double var = 0.0;
  for (int32_t id : patch_ids) {
    const double d = geometry[id].area - mean;
    var += d * d;
  }
  s.area_sd = std::sqrt(var / static_cast<double>(s.count));

  s.shape_mn = meanOf(geometry, patch_ids, &PatchGeometry::shape);
  s.shape_am = detail::ratio(shape_weighted, s.area);
  s.frac_mn = meanOf(geometry, patch_ids, &PatchGeometry::frac);
  s.para_mn = meanOf(geometry, patch_ids, &PatchGeometry::para);
  s.circle_mn = meanOf(geometry, patch_ids, &PatchGeometry::circle);
  s.cai_mn = meanOf(geometry, patch_ids, &PatchGeometry::cai);
  return s;
}

PatchSummary summarizePatches(const std::vector<PatchGeometry>& geometry) {
  std::vector<int32_t> ids(geometry.size());
  std::iota(ids.begin(), ids.end(), 0);
  return summarizePatches(geometry, ids);
}

ClassRecord computeClassMetrics(int32_t class_code,
                                const std::vector<PatchGeometry>& geometry,
                                const std::vector<int32_t>& patch_ids,
                                const ClassAdjacency& adjacency,
                                const LandscapeExtent& extent) {
  const double TA = extent.total_area;
  const PatchSummary s = summarizePatches(geometry, patch_ids);

  ClassRecord r;
  r.class_code = class_code;
  r.adjacency = adjacency;
  r.area_sq = s.area_sq;

  // Area and density
  r.ca = s.area;
  r.pland = detail::ratio(100.0 * r.ca, TA);
  r.np = s.count;
  r.pd = detail::ratio(100.0 * static_cast<double>(r.np), TA);
  r.area_mn = s.area_mn();
  r.area_sd = s.area_sd;

  // Edge
  r.te = static_cast<double>(adjacency.edgeSides()) * extent.cell_size;
  r.ed = detail::ratio(r.te, TA);
  r.lsi = detail::ratio(
      static_cast<double>(adjacency.edgeSides()),
      static_cast<double>(minPerimeterSides(adjacency.cells)));

  // Shape
  r.shape_mn = s.shape_mn;
  r.shape_am = s.shape_am;
  r.frac_mn = s.frac_mn;
  r.para_mn = s.para_mn;
  r.circle_mn = s.circle_mn;

  // Core area
  r.tca = s.core_area;
  r.cpland = detail::ratio(100.0 * r.tca, TA);
  r.cai = detail::ratio(100.0 * r.tca, r.ca);
  r.cai_mn = s.cai_mn;
  r.ndca = s.core_regions;

  // Aggregation
  r.ai = aggregationIndex(adjacency);
  r.clumpy = clumpiness(adjacency, detail::ratio(r.ca, TA));
  r.cohesion = cohesion(geometry, patch_ids, extent.data_cells);
  if (r.ca > 0.0) {
    r.division = 1.0 - s.area_sq / (r.ca * r.ca);
  }
  r.split = detail::ratio(TA * TA, s.area_sq);
  r.mesh = detail::ratio(s.area_sq, TA);

  return r;
}

std::vector<ClassRecord> aggregateClasses(
    const LandscapeGrid& grid, const PatchRegistry& registry,
    const std::vector<PatchGeometry>& geometry) {
  const LandscapeExtent extent = LandscapeExtent::of(grid);
  const auto adjacency = countAdjacencies(grid);

  std::vector<ClassRecord> classes;
  classes.reserve(adjacency.size());
  for (const auto& [code, adj] : adjacency) {
    classes.push_back(computeClassMetrics(
        code, geometry, registry.patchesOfClass(code), adj, extent));
  }

  spdlog::debug("[ClassMetrics] {} classes over {} data cells", classes.size(),
                extent.data_cells);
  return classes;
}

}  // namespace lsmetrics
