// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "lsmetrics/lsmetrics.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lsmetrics {

LandscapeMetrics::LandscapeMetrics(const Config& cfg) : cfg_(cfg) {
  if (cfg_.core_area.edge_depth < 0) cfg_.core_area.edge_depth = 0;
  if (cfg_.output.metrics.empty()) cfg_.output.metrics = allMetrics();
}

LandscapeMetrics& LandscapeMetrics::setConnectivity(
    Connectivity connectivity) noexcept {
  cfg_.labeling.connectivity = connectivity;
  return *this;
}

LandscapeMetrics& LandscapeMetrics::setEdgeDepth(int edge_depth) {
  if (edge_depth < 0) {
    spdlog::warn(
        "[LandscapeMetrics] edge_depth ({}) must be >= 0, clamping to 0",
        edge_depth);
  }
  cfg_.core_area.edge_depth = std::max(0, edge_depth);
  return *this;
}

LandscapeMetrics& LandscapeMetrics::setMetrics(
    const std::vector<MetricId>& metrics) {
  cfg_.output.metrics =
      metrics.empty() ? allMetrics() : canonicalMetrics(metrics);
  return *this;
}

MetricsResult LandscapeMetrics::compute(const LandscapeGrid& grid) const {
  MetricsResult result;
  result.patches = PatchLabeler(cfg_.labeling.connectivity).label(grid);
  result.geometry = computePatchGeometry(grid, result.patches, cfg_.core_area);
  result.classes = aggregateClasses(grid, result.patches, result.geometry);
  result.landscape =
      computeLandscapeMetrics(grid, result.classes, result.geometry);
  result.table = ResultTable::build(result.classes, result.landscape,
                                    cfg_.output.metrics);

  spdlog::debug("[LandscapeMetrics] {}x{} grid: {} patches, {} classes",
                grid.rows(), grid.cols(), result.patches.size(),
                result.classes.size());
  return result;
}

ResultTable computeMetrics(const LandscapeGrid& grid, const Config& cfg) {
  return LandscapeMetrics(cfg).compute(grid).table;
}

}  // namespace lsmetrics
