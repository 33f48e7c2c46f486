// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * result_table.hpp
 *
 * Class and landscape rows assembled into one table with metric columns.
 */

#ifndef LSMETRICS_RESULT_TABLE_HPP
#define LSMETRICS_RESULT_TABLE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "lsmetrics/metrics/class_metrics.hpp"
#include "lsmetrics/metrics/landscape_metrics.hpp"
#include "lsmetrics/metrics/metric_id.hpp"

namespace lsmetrics {

enum class RowLevel { Class, Landscape };

/// One table row; `values` follows ResultTable::columns().
struct ResultRow {
  RowLevel level = RowLevel::Class;
  std::optional<int32_t> class_code;  ///< Empty on the landscape row
  std::vector<double> values;
};

/// Value of `id` in a class record (NaN if landscape-only).
double metricValue(const ClassRecord& record, MetricId id);

/// Value of `id` in the landscape record (NaN if class-only).
double metricValue(const LandscapeRecord& record, MetricId id);

/**
 * @brief Metrics table: one row per class (ascending code), then one
 * landscape row.
 *
 * Columns are the requested metric identifiers in canonical order. A metric
 * not defined for a row, or undefined for its data, is NaN.
 *
 * @code
 *   auto table = ResultTable::build(classes, landscape,
 *                                   {MetricId::CA, MetricId::SHDI});
 *   double forest_ca = table.value(*table.classRow(2), MetricId::CA);
 *   table.writeCsv(std::cout);
 * @endcode
 */
class ResultTable {
 public:
  ResultTable() = default;

  static ResultTable build(const std::vector<ClassRecord>& classes,
                           const LandscapeRecord& landscape,
                           const std::vector<MetricId>& metrics = allMetrics());

  const std::vector<MetricId>& columns() const { return columns_; }
  const std::vector<ResultRow>& rows() const { return rows_; }
  size_t size() const { return rows_.size(); }

  bool hasColumn(MetricId id) const;

  /// @throws std::out_of_range if the row or column is absent.
  double value(size_t row, MetricId id) const;
  double value(const ResultRow& row, MetricId id) const;

  /// Row of a class code, nullptr if the class is absent.
  const ResultRow* classRow(int32_t class_code) const;

  /// The landscape row (always the last row).
  const ResultRow& landscapeRow() const { return rows_.back(); }

  /// CSV with header `level,class,<metrics...>`; NaN printed as `NA`.
  void writeCsv(std::ostream& os) const;
  std::string toCsv() const;

 private:
  size_t columnIndex(MetricId id) const;

  std::vector<MetricId> columns_;
  std::vector<ResultRow> rows_;
};

/// Patch-level CSV: patch_id,class,AREA,PERIM,CORE,NCORE,SHAPE,FRAC,PARA,
/// CIRCLE,CAI.
void writePatchCsv(std::ostream& os,
                   const std::vector<PatchGeometry>& geometry);

}  // namespace lsmetrics

#endif  // LSMETRICS_RESULT_TABLE_HPP
