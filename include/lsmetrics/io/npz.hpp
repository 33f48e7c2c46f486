// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * npz.hpp
 *
 * NumPy .npz archives of class rasters and patch-id grids.
 * Compatible with numpy.load() / numpy.savez() in Python.
 *
 * Grid archive layout:
 *   class.npy   2-D class codes (|b1, |u1, |i1, <i2, <u2, <i4, <i8, <f4, <f8;
 *               NaN in float arrays is nodata)
 *   nodata.npy  optional 2-D mask (|b1 or |u1, nonzero = nodata)
 *   meta.npy    optional JSON string: cell_size, area_unit_scale,
 *               nodata_value
 */

#ifndef LSMETRICS_IO_NPZ_HPP
#define LSMETRICS_IO_NPZ_HPP

#include <optional>
#include <string>

#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"

namespace lsmetrics {
namespace io {

/// Load a grid from an .npz archive.
/// @return nullopt on I/O or format errors (logged).
/// @throws InvalidGridError if the decoded raster is not a valid grid.
std::optional<LandscapeGrid> loadGridNpz(const std::string& filename);

/// Save class codes, nodata mask and metadata as an .npz archive.
bool saveGridNpz(const std::string& filename, const LandscapeGrid& grid);

/// Save the patch-id grid (`patch_id.npy`, <i4, -1 on nodata) + metadata.
bool savePatchIdsNpz(const std::string& filename, const LandscapeGrid& grid,
                     const PatchRegistry& registry);

/// Load a patch-id grid saved by savePatchIdsNpz().
std::optional<LabelMatrix> loadPatchIdsNpz(const std::string& filename);

}  // namespace io
}  // namespace lsmetrics

#endif  // LSMETRICS_IO_NPZ_HPP
