// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * metric_id.hpp
 *
 * Metric identifiers used as result table columns.
 */

#ifndef LSMETRICS_METRICS_METRIC_ID_HPP
#define LSMETRICS_METRICS_METRIC_ID_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lsmetrics {

/// Metric identifiers in canonical column order.
enum class MetricId {
  // Area and density
  TA,
  CA,
  PLAND,
  NP,
  PD,
  AREA_MN,
  AREA_SD,
  // Edge
  TE,
  ED,
  LSI,
  // Shape
  SHAPE_MN,
  SHAPE_AM,
  FRAC_MN,
  PARA_MN,
  CIRCLE_MN,
  // Core area
  TCA,
  CPLAND,
  CAI,
  CAI_MN,
  NDCA,
  // Aggregation
  AI,
  CLUMPY,
  COHESION,
  DIVISION,
  SPLIT,
  MESH,
  // Diversity
  SHDI,
  SHEI,
  SIDI,
  SIEI,
  MSIDI,
  PR,
  PRD,
};

/// Levels at which a metric is defined.
enum class MetricLevel { Class, Landscape, Both };

/// Identifier string, e.g. "PLAND".
const char* metricName(MetricId id);

MetricLevel metricLevel(MetricId id);

inline bool appliesToClass(MetricId id) {
  return metricLevel(id) != MetricLevel::Landscape;
}

inline bool appliesToLandscape(MetricId id) {
  return metricLevel(id) != MetricLevel::Class;
}

/// Case-insensitive lookup; nullopt if unknown.
std::optional<MetricId> findMetricId(std::string_view name);

/// Case-insensitive lookup.
/// @throws std::invalid_argument if the name is unknown.
MetricId parseMetricId(const std::string& name);

/// Every metric in canonical order.
const std::vector<MetricId>& allMetrics();

/// Sort into canonical order and drop duplicates.
std::vector<MetricId> canonicalMetrics(std::vector<MetricId> metrics);

}  // namespace lsmetrics

#endif  // LSMETRICS_METRICS_METRIC_ID_HPP
