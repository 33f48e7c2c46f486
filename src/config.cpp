// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config.cpp
 *
 * YAML configuration loading.
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

#include "lsmetrics/config/metrics.hpp"

namespace lsmetrics {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

Connectivity parseConnectivity(int value) {
  if (value == 4) return Connectivity::Four;
  if (value == 8) return Connectivity::Eight;
  spdlog::warn("[Config] Unknown labeling.connectivity '{}', defaulting to 4",
               value);
  return Connectivity::Four;
}

bool isAllKeyword(std::string name) {
  std::transform(name.begin(), name.end(), name.begin(), [](char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return name == "all";
}

std::vector<MetricId> parseMetricList(const YAML::Node& node) {
  if (node.IsScalar()) {
    const auto name = node.as<std::string>();
    if (isAllKeyword(name)) return allMetrics();
    if (auto id = findMetricId(name)) return {*id};
    spdlog::warn("[Config] Unknown metric '{}', ignoring", name);
    return {};
  }

  std::vector<MetricId> metrics;
  for (const auto& item : node) {
    const auto name = item.as<std::string>();
    if (isAllKeyword(name)) return allMetrics();
    if (auto id = findMetricId(name)) {
      metrics.push_back(*id);
    } else {
      spdlog::warn("[Config] Unknown metric '{}', ignoring", name);
    }
  }
  return metrics;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Patch labeling
  if (auto n = root["labeling"]) {
    if (n["connectivity"]) {
      cfg.labeling.connectivity =
          parseConnectivity(n["connectivity"].as<int>());
    }
  }

  // Core area
  if (auto n = root["core_area"]) {
    load(n, "edge_depth", cfg.core_area.edge_depth);
  }

  // Output selection
  if (auto n = root["output"]) {
    if (auto m = n["metrics"]) {
      cfg.output.metrics = parseMetricList(m);
    }
    load(n, "patch_table", cfg.output.patch_table);
  }

  return cfg;
}

void validate(Config& cfg) {
  if (cfg.core_area.edge_depth < 0) {
    spdlog::warn(
        "[Config] core_area.edge_depth ({}) must be >= 0, clamping to 0",
        cfg.core_area.edge_depth);
    cfg.core_area.edge_depth = 0;
  }

  if (cfg.output.metrics.empty()) {
    spdlog::warn("[Config] output.metrics is empty, computing all metrics");
    cfg.output.metrics = allMetrics();
  }
  cfg.output.metrics = canonicalMetrics(std::move(cfg.output.metrics));
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

}  // namespace lsmetrics
