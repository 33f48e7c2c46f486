// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * lsm_report: Compute landscape metrics of a class raster stored as .npz.
 *
 * Prints the class/landscape table as CSV on stdout. With --patches (or
 * output.patch_table in the config) the patch table follows after a blank
 * line. Log level: SPDLOG_LEVEL=debug.
 *
 * Usage:
 *   ./lsm_report grid.npz [config.yaml] [--patches]
 *
 * Example:
 *   ./lsm_report landcover.npz ../config/default.yaml > metrics.csv
 */

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <lsmetrics/io/npz.hpp>
#include <lsmetrics/lsmetrics.hpp>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lsmetrics;

int main(int argc, char** argv) {
  spdlog::cfg::load_env_levels();

  std::vector<std::string> positional;
  bool patches = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--patches") {
      patches = true;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty() || positional.size() > 2) {
    std::cerr << "Usage: lsm_report <grid.npz> [config.yaml] [--patches]\n"
              << "  grid.npz: class.npy (+ nodata.npy, meta.npy)\n"
              << "  --patches: also print the patch table\n";
    return 1;
  }

  // Config
  Config cfg;
  if (positional.size() == 2) {
    try {
      cfg = loadConfig(positional[1]);
    } catch (const std::exception& e) {
      spdlog::error("{}", e.what());
      return 1;
    }
  }
  patches = patches || cfg.output.patch_table;

  try {
    // Load
    auto grid = io::loadGridNpz(positional[0]);
    if (!grid) return 1;
    spdlog::info("Loaded {}x{} grid ({} data cells, cell size {})",
                 grid->rows(), grid->cols(), grid->dataCellCount(),
                 grid->cellSize());

    // Compute
    const MetricsResult result = LandscapeMetrics(cfg).compute(*grid);
    spdlog::info("{} patches in {} classes", result.patches.size(),
                 result.classes.size());

    // Export
    result.table.writeCsv(std::cout);
    if (patches) {
      std::cout << '\n';
      writePatchCsv(std::cout, result.geometry);
    }
  } catch (const InvalidGridError& e) {
    spdlog::error("{}", e.what());
    return 2;
  }

  return 0;
}
