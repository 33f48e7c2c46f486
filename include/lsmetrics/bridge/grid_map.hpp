// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_map.hpp
 *
 * Conversions between grid_map layers and LandscapeGrid / patch ids.
 * Header-only; requires grid_map_core.
 */

#ifndef LSMETRICS_BRIDGE_GRID_MAP_HPP
#define LSMETRICS_BRIDGE_GRID_MAP_HPP

#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include <grid_map_core/grid_map_core.hpp>

#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

namespace lsmetrics::grid_map_bridge {

/**
 * @brief Build a LandscapeGrid from a grid_map layer.
 *
 * Grid row/col follow the map's unwrapped (i, j) index, so a map whose
 * circular buffer was shifted converts the same as an unshifted one. NaN
 * cells become nodata; other values are rounded to integer class codes.
 *
 * @throws std::invalid_argument if the layer does not exist.
 * @throws InvalidGridError if the map is empty.
 */
inline LandscapeGrid fromGridMap(
    const grid_map::GridMap& map, const std::string& layer,
    double area_unit_scale = kSquareMetersToHectares) {
  if (!map.exists(layer)) {
    throw std::invalid_argument("[grid_map_bridge] Layer '" + layer +
                                "' does not exist");
  }
  const auto& data = map.get(layer);
  const grid_map::Size size = map.getSize();
  const grid_map::Index start = map.getStartIndex();

  ClassMatrix codes = ClassMatrix::Zero(size(0), size(1));
  MaskMatrix nodata = MaskMatrix::Constant(size(0), size(1), false);
  for (int r = 0; r < size(0); ++r) {
    for (int c = 0; c < size(1); ++c) {
      const grid_map::Index buffer = grid_map::getBufferIndexFromIndex(
          grid_map::Index(r, c), size, start);
      const float v = data(buffer(0), buffer(1));
      if (std::isnan(v)) {
        nodata(r, c) = true;
      } else {
        codes(r, c) = static_cast<int32_t>(std::lround(v));
      }
    }
  }
  return LandscapeGrid(std::move(codes), std::move(nodata),
                       map.getResolution(), area_unit_scale);
}

/**
 * @brief Write a patch-id grid into a grid_map layer (NaN on nodata).
 *
 * The registry must come from a grid built by fromGridMap() on the same map.
 *
 * @throws std::invalid_argument on size mismatch.
 */
inline void addPatchLayer(grid_map::GridMap& map,
                          const PatchRegistry& registry,
                          const std::string& layer = "patch_id") {
  const grid_map::Size size = map.getSize();
  const LabelMatrix& labels = registry.labels();
  if (labels.rows() != size(0) || labels.cols() != size(1)) {
    throw std::invalid_argument("[grid_map_bridge] Patch grid size mismatch");
  }

  map.add(layer, std::numeric_limits<float>::quiet_NaN());
  auto& data = map.get(layer);
  const grid_map::Index start = map.getStartIndex();
  for (int r = 0; r < size(0); ++r) {
    for (int c = 0; c < size(1); ++c) {
      const int32_t id = labels(r, c);
      if (id == kNoPatch) continue;
      const grid_map::Index buffer = grid_map::getBufferIndexFromIndex(
          grid_map::Index(r, c), size, start);
      data(buffer(0), buffer(1)) = static_cast<float>(id);
    }
  }
}

}  // namespace lsmetrics::grid_map_bridge

#endif  // LSMETRICS_BRIDGE_GRID_MAP_HPP
