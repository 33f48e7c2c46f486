// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * landscape_metrics.hpp
 *
 * Landscape-level structure and diversity metrics.
 */

#ifndef LSMETRICS_METRICS_LANDSCAPE_METRICS_HPP
#define LSMETRICS_METRICS_LANDSCAPE_METRICS_HPP

#include <cstddef>
#include <vector>

#include "lsmetrics/metrics/class_metrics.hpp"

namespace lsmetrics {

/// Diversity indices of a set of class proportions.
struct Diversity {
  size_t richness = 0;            ///< m: classes with p > 0
  double shdi = kNotApplicable;   ///< Shannon diversity
  double shei = kNotApplicable;   ///< Shannon evenness
  double sidi = kNotApplicable;   ///< Simpson diversity
  double siei = kNotApplicable;   ///< Simpson evenness
  double msidi = kNotApplicable;  ///< Modified Simpson diversity
};

/**
 * @brief Diversity indices from class proportions p_c = CA(c) / TA.
 *
 * Zero proportions are skipped. An empty input yields m = 0 and NaN
 * indices; evenness is NaN for m <= 1.
 */
Diversity computeDiversity(const std::vector<double>& proportions);

/// Metrics of the whole landscape. Undefined values are NaN.
struct LandscapeRecord {
  double ta = 0.0;         ///< Data area [ha]
  double grid_area = 0.0;  ///< All cells, nodata included [ha]

  size_t np = 0;
  double pd = kNotApplicable;
  double area_mn = kNotApplicable;
  double area_sd = kNotApplicable;

  double te = 0.0;
  double ed = kNotApplicable;
  double lsi = kNotApplicable;

  double shape_mn = kNotApplicable;
  double shape_am = kNotApplicable;
  double frac_mn = kNotApplicable;
  double para_mn = kNotApplicable;
  double circle_mn = kNotApplicable;

  double tca = 0.0;
  double cai_mn = kNotApplicable;
  size_t ndca = 0;

  double ai = kNotApplicable;
  double division = kNotApplicable;
  double split = kNotApplicable;
  double mesh = kNotApplicable;

  Diversity diversity;
  double prd = kNotApplicable;  ///< Patch richness density [per 100 ha]
};

/// Aggregate class records and patch geometry into the landscape record.
LandscapeRecord computeLandscapeMetrics(
    const std::vector<ClassRecord>& classes,
    const std::vector<PatchGeometry>& geometry, const LandscapeExtent& extent,
    double grid_area);

/// Convenience overload taking the extent from the grid.
LandscapeRecord computeLandscapeMetrics(
    const LandscapeGrid& grid, const std::vector<ClassRecord>& classes,
    const std::vector<PatchGeometry>& geometry);

}  // namespace lsmetrics

#endif  // LSMETRICS_METRICS_LANDSCAPE_METRICS_HPP
