// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * landscape_grid.hpp
 *
 * Immutable categorical raster: class codes, nodata mask, cell size and
 * the factor converting squared linear units to hectares.
 */

#ifndef LSMETRICS_LANDSCAPE_GRID_HPP
#define LSMETRICS_LANDSCAPE_GRID_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Core>

namespace lsmetrics {

/// Row-major class code raster.
using ClassMatrix =
    Eigen::Matrix<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Row-major nodata mask (true = nodata).
using MaskMatrix =
    Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Area scale for grids in meters: m² → ha.
inline constexpr double kSquareMetersToHectares = 1e-4;

// ─── CellOffset ─────────────────────────────────────────────────────────────

/// Relative (row, col) offset of a neighboring cell.
struct CellOffset {
  int dr, dc;
};

/// Edge-adjacent offsets (up, left, right, down).
inline constexpr CellOffset kEdgeNeighbors[4] = {
    {-1, 0}, {0, -1}, {0, 1}, {1, 0}};

// ─── LandscapeGrid ──────────────────────────────────────────────────────────

/**
 * @brief Categorical landscape raster analysed by the metrics engine.
 *
 * Holds one class code per cell plus a same-shape nodata mask. Cells are
 * square with edge length `cellSize()` in the grid's linear unit;
 * `areaUnitScale()` converts squared linear units to hectares.
 *
 * The grid is validated once on construction and is immutable afterwards.
 *
 * @code
 *   ClassMatrix codes(3, 3);
 *   codes << 1, 1, 2,
 *            1, 2, 2,
 *            3, 3, 2;
 *   MaskMatrix nodata = MaskMatrix::Constant(3, 3, false);
 *   LandscapeGrid grid(codes, nodata, 30.0);  // 30 m cells
 * @endcode
 *
 * @throws InvalidGridError on zero size, shape mismatch, non-positive cell
 *         size or non-positive area scale.
 */
class LandscapeGrid {
 public:
  LandscapeGrid(ClassMatrix codes, MaskMatrix nodata, double cell_size,
                double area_unit_scale = kSquareMetersToHectares);

  /// Construct from separate cell width/height; rejects non-square cells.
  static LandscapeGrid fromCellDimensions(
      ClassMatrix codes, MaskMatrix nodata, double cell_width,
      double cell_height, double area_unit_scale = kSquareMetersToHectares);

  /// Construct with the nodata mask derived from a sentinel class code.
  static LandscapeGrid withNodataValue(
      ClassMatrix codes, int32_t nodata_value, double cell_size,
      double area_unit_scale = kSquareMetersToHectares);

  /// Construct a grid without nodata cells.
  static LandscapeGrid withoutNodata(
      ClassMatrix codes, double cell_size,
      double area_unit_scale = kSquareMetersToHectares);

  int rows() const noexcept { return static_cast<int>(codes_.rows()); }
  int cols() const noexcept { return static_cast<int>(codes_.cols()); }
  size_t cellCount() const noexcept {
    return static_cast<size_t>(codes_.size());
  }

  double cellSize() const noexcept { return cell_size_; }
  double areaUnitScale() const noexcept { return area_unit_scale_; }

  /// Area of one cell in squared linear units.
  double cellArea() const noexcept { return cell_size_ * cell_size_; }

  /// Area of one cell in hectares.
  double cellAreaHa() const noexcept { return cellArea() * area_unit_scale_; }

  bool contains(int row, int col) const noexcept {
    return row >= 0 && row < rows() && col >= 0 && col < cols();
  }

  /// True if (row, col) lies inside the grid and is not nodata.
  bool isData(int row, int col) const noexcept {
    return contains(row, col) && !nodata_(row, col);
  }

  bool isNodata(int row, int col) const noexcept { return nodata_(row, col); }

  int32_t code(int row, int col) const noexcept { return codes_(row, col); }

  const ClassMatrix& codes() const noexcept { return codes_; }
  const MaskMatrix& nodataMask() const noexcept { return nodata_; }

  size_t dataCellCount() const noexcept { return data_cells_; }
  size_t nodataCellCount() const noexcept { return cellCount() - data_cells_; }

  /// Area of every cell, nodata included [ha].
  double gridAreaHa() const noexcept {
    return static_cast<double>(cellCount()) * cellAreaHa();
  }

  /// Area of non-nodata cells (total landscape area, TA) [ha].
  double dataAreaHa() const noexcept {
    return static_cast<double>(data_cells_) * cellAreaHa();
  }

  /// Area of nodata cells [ha].
  double nodataAreaHa() const noexcept {
    return static_cast<double>(nodataCellCount()) * cellAreaHa();
  }

  /// Sorted distinct class codes of data cells.
  std::vector<int32_t> classCodes() const;

 private:
  ClassMatrix codes_;
  MaskMatrix nodata_;
  double cell_size_;
  double area_unit_scale_;
  size_t data_cells_ = 0;
};

}  // namespace lsmetrics

#endif  // LSMETRICS_LANDSCAPE_GRID_HPP
