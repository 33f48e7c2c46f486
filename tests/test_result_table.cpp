// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include <gtest/gtest.h>

#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "lsmetrics/landscape_grid.hpp"
#include "lsmetrics/metrics/metric_id.hpp"
#include "lsmetrics/patches/patch_geometry.hpp"
#include "lsmetrics/patches/patch_labeling.hpp"
#include "lsmetrics/result_table.hpp"

using namespace lsmetrics;

// ─── Helpers ────────────────────────────────────────────────────────────────

namespace {

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream is(text);
  std::string line;
  while (std::getline(is, line)) lines.push_back(line);
  return lines;
}

}  // namespace

class ResultTableTest : public ::testing::Test {
 protected:
  std::vector<PatchGeometry> geometry;
  std::vector<ClassRecord> classes;
  LandscapeRecord landscape;

  void SetUp() override {
    ClassMatrix codes(3, 3);
    codes << 5, 5, 2,  //
        5, 2, 2,       //
        -1, 7, 7;
    LandscapeGrid grid = LandscapeGrid::withNodataValue(codes, -1, 10.0);
    PatchRegistry patches = labelPatches(grid);
    geometry = computePatchGeometry(grid, patches);
    classes = aggregateClasses(grid, patches, geometry);
    landscape = computeLandscapeMetrics(grid, classes, geometry);
  }
};

// ─── Layout ─────────────────────────────────────────────────────────────────

TEST_F(ResultTableTest, ClassRowsThenLandscapeRow) {
  const ResultTable table = ResultTable::build(classes, landscape);

  ASSERT_EQ(table.size(), 4u);
  EXPECT_EQ(table.rows()[0].class_code, 2);
  EXPECT_EQ(table.rows()[1].class_code, 5);
  EXPECT_EQ(table.rows()[2].class_code, 7);
  EXPECT_EQ(table.landscapeRow().level, RowLevel::Landscape);
  EXPECT_FALSE(table.landscapeRow().class_code.has_value());
  EXPECT_EQ(table.columns(), allMetrics());
}

TEST_F(ResultTableTest, ColumnsInCanonicalOrder) {
  const ResultTable table = ResultTable::build(
      classes, landscape, {MetricId::SHDI, MetricId::CA, MetricId::NP});

  ASSERT_EQ(table.columns().size(), 3u);
  EXPECT_EQ(table.columns()[0], MetricId::CA);
  EXPECT_EQ(table.columns()[1], MetricId::NP);
  EXPECT_EQ(table.columns()[2], MetricId::SHDI);
  EXPECT_TRUE(table.hasColumn(MetricId::NP));
  EXPECT_FALSE(table.hasColumn(MetricId::AI));
}

TEST_F(ResultTableTest, LevelSpecificMetricsAreNaN) {
  const ResultTable table = ResultTable::build(classes, landscape);
  const ResultRow* row = table.classRow(5);
  ASSERT_NE(row, nullptr);

  EXPECT_TRUE(std::isnan(table.value(*row, MetricId::SHDI)));
  EXPECT_TRUE(std::isnan(table.value(*row, MetricId::TA)));
  EXPECT_FALSE(std::isnan(table.value(*row, MetricId::CA)));

  const ResultRow& total = table.landscapeRow();
  EXPECT_TRUE(std::isnan(table.value(total, MetricId::CA)));
  EXPECT_TRUE(std::isnan(table.value(total, MetricId::PLAND)));
  EXPECT_FALSE(std::isnan(table.value(total, MetricId::SHDI)));
}

TEST_F(ResultTableTest, ValuesMatchRecords) {
  const ResultTable table = ResultTable::build(classes, landscape);

  const ResultRow* row = table.classRow(7);
  ASSERT_NE(row, nullptr);
  EXPECT_DOUBLE_EQ(table.value(*row, MetricId::CA), 0.02);
  EXPECT_DOUBLE_EQ(table.value(*row, MetricId::NP), 1.0);

  const size_t last = table.size() - 1;
  EXPECT_DOUBLE_EQ(table.value(last, MetricId::TA), landscape.ta);
  EXPECT_DOUBLE_EQ(table.value(last, MetricId::NP),
                   static_cast<double>(landscape.np));
  EXPECT_DOUBLE_EQ(table.value(last, MetricId::PR), 3.0);
}

TEST_F(ResultTableTest, MissingEntriesReported) {
  const ResultTable table =
      ResultTable::build(classes, landscape, {MetricId::CA});

  EXPECT_EQ(table.classRow(3), nullptr);
  EXPECT_THROW(table.value(0, MetricId::SHDI), std::out_of_range);
  EXPECT_THROW(table.value(10, MetricId::CA), std::out_of_range);
}

TEST(MetricValueTest, LevelMismatchIsNaN) {
  ClassRecord c;
  c.ca = 1.5;
  LandscapeRecord l;
  l.ta = 3.0;

  EXPECT_DOUBLE_EQ(metricValue(c, MetricId::CA), 1.5);
  EXPECT_TRUE(std::isnan(metricValue(c, MetricId::TA)));
  EXPECT_DOUBLE_EQ(metricValue(l, MetricId::TA), 3.0);
  EXPECT_TRUE(std::isnan(metricValue(l, MetricId::CA)));
}

// ─── CSV ────────────────────────────────────────────────────────────────────

TEST_F(ResultTableTest, CsvLayout) {
  const ResultTable table = ResultTable::build(
      classes, landscape, {MetricId::CA, MetricId::NP, MetricId::SHDI});
  const auto lines = splitLines(table.toCsv());

  ASSERT_EQ(lines.size(), 5u);
  EXPECT_EQ(lines[0], "level,class,CA,NP,SHDI");
  EXPECT_EQ(lines[1].rfind("class,2,", 0), 0u);
  EXPECT_EQ(lines[3].rfind("class,7,", 0), 0u);
  // Diversity does not apply to classes
  EXPECT_EQ(lines[1].substr(lines[1].size() - 3), ",NA");
  EXPECT_EQ(lines[4].rfind("landscape,,NA,", 0), 0u);
}

TEST_F(ResultTableTest, WriteCsvMatchesToCsv) {
  const ResultTable table = ResultTable::build(classes, landscape);
  std::ostringstream os;
  table.writeCsv(os);
  EXPECT_EQ(os.str(), table.toCsv());
}

TEST_F(ResultTableTest, PatchCsv) {
  std::ostringstream os;
  writePatchCsv(os, geometry);
  const auto lines = splitLines(os.str());

  ASSERT_EQ(lines.size(), geometry.size() + 1);
  EXPECT_EQ(lines[0],
            "patch_id,class,AREA,PERIM,CORE,NCORE,SHAPE,FRAC,PARA,CIRCLE,CAI");
  EXPECT_EQ(lines[1].rfind("0,5,", 0), 0u);
}

// ─── Metric identifiers ─────────────────────────────────────────────────────

TEST(MetricIdTest, NamesRoundTrip) {
  for (MetricId id : allMetrics()) {
    EXPECT_EQ(parseMetricId(metricName(id)), id);
  }
  EXPECT_EQ(allMetrics().size(), 33u);
  EXPECT_EQ(allMetrics().front(), MetricId::TA);
  EXPECT_EQ(allMetrics().back(), MetricId::PRD);
}

TEST(MetricIdTest, LookupIsCaseInsensitive) {
  EXPECT_EQ(parseMetricId("pland"), MetricId::PLAND);
  EXPECT_EQ(parseMetricId("Area_Mn"), MetricId::AREA_MN);
  EXPECT_FALSE(findMetricId("XYZ").has_value());
  EXPECT_THROW(parseMetricId("XYZ"), std::invalid_argument);
}

TEST(MetricIdTest, Levels) {
  EXPECT_TRUE(appliesToClass(MetricId::CA));
  EXPECT_FALSE(appliesToLandscape(MetricId::CA));
  EXPECT_TRUE(appliesToLandscape(MetricId::SHDI));
  EXPECT_FALSE(appliesToClass(MetricId::SHDI));
  EXPECT_EQ(metricLevel(MetricId::NP), MetricLevel::Both);
  EXPECT_EQ(metricLevel(MetricId::CLUMPY), MetricLevel::Class);
  EXPECT_EQ(metricLevel(MetricId::PRD), MetricLevel::Landscape);
}

TEST(MetricIdTest, CanonicalOrderDropsDuplicates) {
  const auto ids = canonicalMetrics(
      {MetricId::SHDI, MetricId::CA, MetricId::SHDI, MetricId::TA});
  ASSERT_EQ(ids.size(), 3u);
  EXPECT_EQ(ids[0], MetricId::TA);
  EXPECT_EQ(ids[1], MetricId::CA);
  EXPECT_EQ(ids[2], MetricId::SHDI);
}
