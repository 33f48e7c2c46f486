// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "lsmetrics/metrics/metric_id.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lsmetrics {

namespace {

struct MetricInfo {
  MetricId id;
  const char* name;
  MetricLevel level;
};

constexpr MetricInfo kMetrics[] = {
    {MetricId::TA, "TA", MetricLevel::Landscape},
    {MetricId::CA, "CA", MetricLevel::Class},
    {MetricId::PLAND, "PLAND", MetricLevel::Class},
    {MetricId::NP, "NP", MetricLevel::Both},
    {MetricId::PD, "PD", MetricLevel::Both},
    {MetricId::AREA_MN, "AREA_MN", MetricLevel::Both},
    {MetricId::AREA_SD, "AREA_SD", MetricLevel::Both},
    {MetricId::TE, "TE", MetricLevel::Both},
    {MetricId::ED, "ED", MetricLevel::Both},
    {MetricId::LSI, "LSI", MetricLevel::Both},
    {MetricId::SHAPE_MN, "SHAPE_MN", MetricLevel::Both},
    {MetricId::SHAPE_AM, "SHAPE_AM", MetricLevel::Both},
    {MetricId::FRAC_MN, "FRAC_MN", MetricLevel::Both},
    {MetricId::PARA_MN, "PARA_MN", MetricLevel::Both},
    {MetricId::CIRCLE_MN, "CIRCLE_MN", MetricLevel::Both},
    {MetricId::TCA, "TCA", MetricLevel::Both},
    {MetricId::CPLAND, "CPLAND", MetricLevel::Class},
    {MetricId::CAI, "CAI", MetricLevel::Class},
    {MetricId::CAI_MN, "CAI_MN", MetricLevel::Both},
    {MetricId::NDCA, "NDCA", MetricLevel::Both},
    {MetricId::AI, "AI", MetricLevel::Both},
    {MetricId::CLUMPY, "CLUMPY", MetricLevel::Class},
    {MetricId::COHESION, "COHESION", MetricLevel::Class},
    {MetricId::DIVISION, "DIVISION", MetricLevel::Both},
    {MetricId::SPLIT, "SPLIT", MetricLevel::Both},
    {MetricId::MESH, "MESH", MetricLevel::Both},
    {MetricId::SHDI, "SHDI", MetricLevel::Landscape},
    {MetricId::SHEI, "SHEI", MetricLevel::Landscape},
    {MetricId::SIDI, "SIDI", MetricLevel::Landscape},
    {MetricId::SIEI, "SIEI", MetricLevel::Landscape},
    {MetricId::MSIDI, "MSIDI", MetricLevel::Landscape},
    {MetricId::PR, "PR", MetricLevel::Landscape},
    {MetricId::PRD, "PRD", MetricLevel::Landscape},
};

const MetricInfo& info(MetricId id) {
  return kMetrics[static_cast<size_t>(id)];
}

}  // namespace

const char* metricName(MetricId id) { return info(id).name; }

MetricLevel metricLevel(MetricId id) { return info(id).level; }

std::optional<MetricId> findMetricId(std::string_view name) {
  std::string upper(name);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  for (const auto& m : kMetrics) {
    if (upper == m.name) return m.id;
  }
  return std::nullopt;
}

MetricId parseMetricId(const std::string& name) {
  if (auto id = findMetricId(name)) return *id;
  throw std::invalid_argument("Unknown metric identifier '" + name + "'");
}

const std::vector<MetricId>& allMetrics() {
  static const std::vector<MetricId> metrics = [] {
    std::vector<MetricId> ids;
    for (const auto& m : kMetrics) ids.push_back(m.id);
    return ids;
  }();
  return metrics;
}

std::vector<MetricId> canonicalMetrics(std::vector<MetricId> metrics) {
  std::sort(metrics.begin(), metrics.end());
  metrics.erase(std::unique(metrics.begin(), metrics.end()), metrics.end());
  return metrics;
}

}  // namespace lsmetrics
