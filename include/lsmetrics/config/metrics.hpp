// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * metrics.hpp
 *
 * Engine configuration: patch labeling, core area and output selection.
 */

#ifndef LSMETRICS_CONFIG_METRICS_HPP
#define LSMETRICS_CONFIG_METRICS_HPP

#include <string>
#include <vector>

namespace YAML {
class Node;
}

#include "lsmetrics/metrics/metric_id.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

namespace lsmetrics {

namespace config {

struct Labeling {
  Connectivity connectivity = Connectivity::Four;
};

struct CoreArea {
  int edge_depth = 1;  // boundary layers peeled off each patch
};

struct Output {
  std::vector<MetricId> metrics = allMetrics();  // canonical order
  bool patch_table = false;
};

}  // namespace config

/// Configuration of the metrics engine.
struct Config {
  config::Labeling labeling;
  config::CoreArea core_area;
  config::Output output;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

}  // namespace lsmetrics

#endif  // LSMETRICS_CONFIG_METRICS_HPP
