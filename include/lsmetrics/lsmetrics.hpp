// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * lsmetrics.hpp
 *
 * lsmetrics: patch, class and landscape metrics of categorical rasters.
 */

#ifndef LSMETRICS_LSMETRICS_HPP
#define LSMETRICS_LSMETRICS_HPP

#include <vector>

// Configs
#include "lsmetrics/config/metrics.hpp"

// Data types
#include "lsmetrics/exceptions.hpp"
#include "lsmetrics/landscape_grid.hpp"

// Core objects
#include "lsmetrics/metrics/class_metrics.hpp"
#include "lsmetrics/metrics/landscape_metrics.hpp"
#include "lsmetrics/patches/patch_geometry.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"
#include "lsmetrics/result_table.hpp"

namespace lsmetrics {

/// Every intermediate product of one metrics computation.
struct MetricsResult {
  PatchRegistry patches;
  std::vector<PatchGeometry> geometry;  ///< Indexed by patch id
  std::vector<ClassRecord> classes;     ///< Ascending class code
  LandscapeRecord landscape;
  ResultTable table;
};

/**
 * @brief Metrics engine: labeling, patch geometry and aggregation.
 *
 * Holds no state besides its configuration; one instance may process any
 * number of grids. Distinct instances may run on separate threads.
 *
 * @code
 *   LandscapeMetrics engine;
 *   engine.setConnectivity(Connectivity::Eight).setEdgeDepth(2);
 *   MetricsResult result = engine.compute(grid);
 *   result.table.writeCsv(std::cout);
 * @endcode
 */
class LandscapeMetrics {
 public:
  /// Construct with default config (use setters to customize)
  LandscapeMetrics() = default;

  /// Construct with explicit config
  explicit LandscapeMetrics(const Config& cfg);

  /// Patch connectivity (4 or 8 neighbours)
  LandscapeMetrics& setConnectivity(Connectivity connectivity) noexcept;

  /// Boundary depth peeled off for core area [cells]; negative is clamped to 0
  LandscapeMetrics& setEdgeDepth(int edge_depth);

  /// Metric columns of the result table; empty selects every metric
  LandscapeMetrics& setMetrics(const std::vector<MetricId>& metrics);

  const Config& config() const noexcept { return cfg_; }

  MetricsResult compute(const LandscapeGrid& grid) const;

 private:
  Config cfg_;
};

/// Compute the result table of `grid` in one call.
ResultTable computeMetrics(const LandscapeGrid& grid, const Config& cfg = {});

}  // namespace lsmetrics

#endif  // LSMETRICS_LSMETRICS_HPP
