// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * result_table.cpp
 *
 * Metric lookup, table assembly and CSV output.
 */

#include "lsmetrics/result_table.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lsmetrics {

namespace {

std::string formatValue(double v) {
  if (std::isnan(v)) return "NA";
  return fmt::format("{}", v);
}

}  // namespace

double metricValue(const ClassRecord& r, MetricId id) {
  switch (id) {
    case MetricId::CA: return r.ca;
    case MetricId::PLAND: return r.pland;
    case MetricId::NP: return static_cast<double>(r.np);
    case MetricId::PD: return r.pd;
    case MetricId::AREA_MN: return r.area_mn;
    case MetricId::AREA_SD: return r.area_sd;
    case MetricId::TE: return r.te;
    case MetricId::ED: return r.ed;
    case MetricId::LSI: return r.lsi;
    case MetricId::SHAPE_MN: return r.shape_mn;
    case MetricId::SHAPE_AM: return r.shape_am;
    case MetricId::FRAC_MN: return r.frac_mn;
    case MetricId::PARA_MN: return r.para_mn;
    case MetricId::CIRCLE_MN: return r.circle_mn;
    case MetricId::TCA: return r.tca;
    case MetricId::CPLAND: return r.cpland;
    case MetricId::CAI: return r.cai;
    case MetricId::CAI_MN: return r.cai_mn;
    case MetricId::NDCA: return static_cast<double>(r.ndca);
    case MetricId::AI: return r.ai;
    case MetricId::CLUMPY: return r.clumpy;
    case MetricId::COHESION: return r.cohesion;
    case MetricId::DIVISION: return r.division;
    case MetricId::SPLIT: return r.split;
    case MetricId::MESH: return r.mesh;
    default: return kNotApplicable;
  }
}

double metricValue(const LandscapeRecord& r, MetricId id) {
  switch (id) {
    case MetricId::TA: return r.ta;
    case MetricId::NP: return static_cast<double>(r.np);
    case MetricId::PD: return r.pd;
    case MetricId::AREA_MN: return r.area_mn;
    case MetricId::AREA_SD: return r.area_sd;
    case MetricId::TE: return r.te;
    case MetricId::ED: return r.ed;
    case MetricId::LSI: return r.lsi;
    case MetricId::SHAPE_MN: return r.shape_mn;
    case MetricId::SHAPE_AM: return r.shape_am;
    case MetricId::FRAC_MN: return r.frac_mn;
    case MetricId::PARA_MN: return r.para_mn;
    case MetricId::CIRCLE_MN: return r.circle_mn;
    case MetricId::TCA: return r.tca;
    case MetricId::CAI_MN: return r.cai_mn;
    case MetricId::NDCA: return static_cast<double>(r.ndca);
    case MetricId::AI: return r.ai;
    case MetricId::DIVISION: return r.division;
    case MetricId::SPLIT: return r.split;
    case MetricId::MESH: return r.mesh;
    case MetricId::SHDI: return r.diversity.shdi;
    case MetricId::SHEI: return r.diversity.shei;
    case MetricId::SIDI: return r.diversity.sidi;
    case MetricId::SIEI: return r.diversity.siei;
    case MetricId::MSIDI: return r.diversity.msidi;
    case MetricId::PR: return static_cast<double>(r.diversity.richness);
    case MetricId::PRD: return r.prd;
    default: return kNotApplicable;
  }
}

ResultTable ResultTable::build(const std::vector<ClassRecord>& classes,
                               const LandscapeRecord& landscape,
                               const std::vector<MetricId>& metrics) {
  ResultTable table;
  table.columns_ = canonicalMetrics(metrics);
  table.rows_.reserve(classes.size() + 1);

  std::vector<const ClassRecord*> sorted;
  sorted.reserve(classes.size());
  for (const auto& c : classes) sorted.push_back(&c);
  std::sort(sorted.begin(), sorted.end(),
            [](const ClassRecord* a, const ClassRecord* b) {
              return a->class_code < b->class_code;
            });

  for (const ClassRecord* c : sorted) {
    ResultRow row;
    row.level = RowLevel::Class;
    row.class_code = c->class_code;
    row.values.reserve(table.columns_.size());
    for (MetricId id : table.columns_) {
      row.values.push_back(appliesToClass(id) ? metricValue(*c, id)
                                              : kNotApplicable);
    }
    table.rows_.push_back(std::move(row));
  }

  ResultRow row;
  row.level = RowLevel::Landscape;
  row.values.reserve(table.columns_.size());
  for (MetricId id : table.columns_) {
    row.values.push_back(appliesToLandscape(id) ? metricValue(landscape, id)
                                                : kNotApplicable);
  }
  table.rows_.push_back(std::move(row));

  return table;
}

bool ResultTable::hasColumn(MetricId id) const {
  return std::find(columns_.begin(), columns_.end(), id) != columns_.end();
}

size_t ResultTable::columnIndex(MetricId id) const {
  auto it = std::find(columns_.begin(), columns_.end(), id);
  if (it == columns_.end()) {
    throw std::out_of_range(std::string("Metric not in table: ") +
                            metricName(id));
  }
  return static_cast<size_t>(it - columns_.begin());
}

double ResultTable::value(size_t row, MetricId id) const {
  return value(rows_.at(row), id);
}

double ResultTable::value(const ResultRow& row, MetricId id) const {
  return row.values.at(columnIndex(id));
}

const ResultRow* ResultTable::classRow(int32_t class_code) const {
  for (const auto& row : rows_) {
    if (row.level == RowLevel::Class && row.class_code == class_code) {
      return &row;
    }
  }
  return nullptr;
}

void ResultTable::writeCsv(std::ostream& os) const {
  os << "level,class";
  for (MetricId id : columns_) os << ',' << metricName(id);
  os << '\n';

  for (const auto& row : rows_) {
    if (row.level == RowLevel::Class) {
      os << "class," << *row.class_code;
    } else {
      os << "landscape,";
    }
    for (double v : row.values) os << ',' << formatValue(v);
    os << '\n';
  }
}

std::string ResultTable::toCsv() const {
  std::ostringstream os;
  writeCsv(os);
  return os.str();
}

void writePatchCsv(std::ostream& os,
                   const std::vector<PatchGeometry>& geometry) {
  os << "patch_id,class,AREA,PERIM,CORE,NCORE,SHAPE,FRAC,PARA,CIRCLE,CAI\n";
  for (const auto& g : geometry) {
    os << g.patch_id << ',' << g.class_code << ',' << formatValue(g.area)
       << ',' << formatValue(g.perimeter) << ',' << formatValue(g.core_area)
       << ',' << g.core_count << ',' << formatValue(g.shape) << ','
       << formatValue(g.frac) << ',' << formatValue(g.para) << ','
       << formatValue(g.circle) << ',' << formatValue(g.cai) << '\n';
  }
}

}  // namespace lsmetrics
