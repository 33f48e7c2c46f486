// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "lsmetrics/landscape_grid.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "lsmetrics/exceptions.hpp"

namespace lsmetrics {

namespace {

std::string shapeString(Eigen::Index rows, Eigen::Index cols) {
  return "(" + std::to_string(rows) + "x" + std::to_string(cols) + ")";
}

}  // namespace

LandscapeGrid::LandscapeGrid(ClassMatrix codes, MaskMatrix nodata,
                             double cell_size, double area_unit_scale)
    : codes_(std::move(codes)),
      nodata_(std::move(nodata)),
      cell_size_(cell_size),
      area_unit_scale_(area_unit_scale) {
  if (codes_.rows() == 0 || codes_.cols() == 0) {
    throw InvalidGridError("grid has zero size " +
                           shapeString(codes_.rows(), codes_.cols()));
  }
  if (nodata_.rows() != codes_.rows() || nodata_.cols() != codes_.cols()) {
    throw InvalidGridError("nodata mask shape " +
                           shapeString(nodata_.rows(), nodata_.cols()) +
                           " does not match grid shape " +
                           shapeString(codes_.rows(), codes_.cols()));
  }
  if (!std::isfinite(cell_size_) || cell_size_ <= 0.0) {
    throw InvalidGridError("cell size (" + std::to_string(cell_size_) +
                           ") must be finite and > 0");
  }
  if (!std::isfinite(area_unit_scale_) || area_unit_scale_ <= 0.0) {
    throw InvalidGridError("area unit scale (" +
                           std::to_string(area_unit_scale_) +
                           ") must be finite and > 0");
  }

  data_cells_ = cellCount() - static_cast<size_t>(nodata_.count());
}

LandscapeGrid LandscapeGrid::fromCellDimensions(ClassMatrix codes,
                                                MaskMatrix nodata,
                                                double cell_width,
                                                double cell_height,
                                                double area_unit_scale) {
  if (cell_width != cell_height) {
    throw InvalidGridError("non-square cells are not supported (" +
                           std::to_string(cell_width) + " x " +
                           std::to_string(cell_height) + ")");
  }
  return LandscapeGrid(std::move(codes), std::move(nodata), cell_width,
                       area_unit_scale);
}

LandscapeGrid LandscapeGrid::withNodataValue(ClassMatrix codes,
                                             int32_t nodata_value,
                                             double cell_size,
                                             double area_unit_scale) {
  MaskMatrix nodata = codes.cwiseEqual(nodata_value);
  return LandscapeGrid(std::move(codes), std::move(nodata), cell_size,
                       area_unit_scale);
}

LandscapeGrid LandscapeGrid::withoutNodata(ClassMatrix codes, double cell_size,
                                           double area_unit_scale) {
  MaskMatrix nodata = MaskMatrix::Constant(codes.rows(), codes.cols(), false);
  return LandscapeGrid(std::move(codes), std::move(nodata), cell_size,
                       area_unit_scale);
}

std::vector<int32_t> LandscapeGrid::classCodes() const {
  std::vector<int32_t> classes;
  for (int row = 0; row < rows(); ++row) {
    for (int col = 0; col < cols(); ++col) {
      if (!nodata_(row, col)) classes.push_back(codes_(row, col));
    }
  }
  std::sort(classes.begin(), classes.end());
  classes.erase(std::unique(classes.begin(), classes.end()), classes.end());
  return classes;
}

}  // namespace lsmetrics
