// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * landscape_metrics.cpp
 *
 * Landscape-level aggregation and diversity indices.
 */

#include "lsmetrics/metrics/landscape_metrics.hpp"

#include <spdlog/spdlog.h>

#include <cmath>

namespace lsmetrics {

Diversity computeDiversity(const std::vector<double>& proportions) {
  Diversity d;
  double shannon = 0.0;
  double simpson = 0.0;
  for (double p : proportions) {
    if (!(p > 0.0)) continue;
    ++d.richness;
    shannon -= p * std::log(p);
    simpson += p * p;
  }
  if (d.richness == 0) return d;

  const double m = static_cast<double>(d.richness);
  d.shdi = shannon;
  d.sidi = 1.0 - simpson;
  d.msidi = -std::log(simpson);
  if (d.richness > 1) {
    d.shei = d.shdi / std::log(m);
    d.siei = d.sidi / (1.0 - 1.0 / m);
  }
  return d;
}

LandscapeRecord computeLandscapeMetrics(
    const std::vector<ClassRecord>& classes,
    const std::vector<PatchGeometry>& geometry, const LandscapeExtent& extent,
    double grid_area) {
  const double TA = extent.total_area;
  const PatchSummary s = summarizePatches(geometry);

  LandscapeRecord r;
  r.ta = TA;
  r.grid_area = grid_area;

  // Area and density
  r.np = s.count;
  r.pd = detail::ratio(100.0 * static_cast<double>(r.np), TA);
  r.area_mn = s.area_mn();
  r.area_sd = s.area_sd;

  // Edge: unlike sides are seen from both classes, count each once
  size_t unlike_sides = 0;
  size_t boundary_sides = 0;
  for (const auto& c : classes) {
    unlike_sides += c.adjacency.unlike;
    boundary_sides += c.adjacency.boundary;
  }
  const size_t edge_sides = unlike_sides / 2 + boundary_sides;
  r.te = static_cast<double>(edge_sides) * extent.cell_size;
  r.ed = detail::ratio(r.te, TA);
  r.lsi = detail::ratio(
      static_cast<double>(edge_sides),
      static_cast<double>(minPerimeterSides(extent.data_cells)));

  // Shape
  r.shape_mn = s.shape_mn;
  r.shape_am = s.shape_am;
  r.frac_mn = s.frac_mn;
  r.para_mn = s.para_mn;
  r.circle_mn = s.circle_mn;

  // Core area
  r.tca = s.core_area;
  r.cai_mn = s.cai_mn;
  r.ndca = s.core_regions;

  // Aggregation: AI weighted by class proportion
  if (TA > 0.0) {
    double ai = 0.0;
    for (const auto& c : classes) {
      ai += (c.ca / TA) * c.ai;
    }
    r.ai = ai;
    r.division = 1.0 - s.area_sq / (TA * TA);
  }
  r.split = detail::ratio(TA * TA, s.area_sq);
  r.mesh = detail::ratio(s.area_sq, TA);

  // Diversity
  std::vector<double> proportions;
  proportions.reserve(classes.size());
  for (const auto& c : classes) {
    proportions.push_back(detail::ratio(c.ca, TA));
  }
  r.diversity = computeDiversity(proportions);
  r.prd = detail::ratio(100.0 * static_cast<double>(r.diversity.richness), TA);

  return r;
}

LandscapeRecord computeLandscapeMetrics(
    const LandscapeGrid& grid, const std::vector<ClassRecord>& classes,
    const std::vector<PatchGeometry>& geometry) {
  auto record = computeLandscapeMetrics(classes, geometry,
                                        LandscapeExtent::of(grid),
                                        grid.gridAreaHa());
  spdlog::debug("[LandscapeMetrics] {} patches, {} classes, TA {} ha",
                record.np, record.diversity.richness, record.ta);
  return record;
}

}  // namespace lsmetrics
