// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * 01_hello_metrics - lsmetrics basic usage
 *
 * Demonstrates:
 * - Building a LandscapeGrid from class codes
 * - Configuring LandscapeMetrics with the setter API
 * - Reading class and landscape values from the result table
 * - Writing the table as CSV
 */

#include <lsmetrics/lsmetrics.hpp>

#include <iostream>

#include "../common/synthetic_landscape.hpp"

using namespace lsmetrics;

int main() {
  std::cout << "=== 01_hello_metrics ===\n" << std::endl;

  // 1. Create grid (30 m cells)
  LandscapeGrid grid = examples::generateMosaic(40, 60, 12, 3, 30.0);
  examples::printAsciiGrid(grid);
  std::cout << std::endl;

  // 2. Create engine and configure
  LandscapeMetrics engine;
  engine.setConnectivity(Connectivity::Eight).setEdgeDepth(1);

  // 3. Compute
  MetricsResult result = engine.compute(grid);
  std::cout << result.patches.size() << " patches in "
            << result.classes.size() << " classes" << std::endl;

  // 4. Direct access
  for (const auto& c : result.classes) {
    std::cout << "class " << c.class_code << ": CA " << c.ca << " ha, PLAND "
              << c.pland << " %, NP " << c.np << ", AI " << c.ai << std::endl;
  }
  const ResultRow& landscape = result.table.landscapeRow();
  std::cout << "SHDI " << result.table.value(landscape, MetricId::SHDI)
            << ", SIDI " << result.table.value(landscape, MetricId::SIDI)
            << "\n" << std::endl;

  // 5. Export
  result.table.writeCsv(std::cout);

  return 0;
}
