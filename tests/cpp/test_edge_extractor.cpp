#include <gtest/gtest.h>

#include <array>
#include <cmath>

#include "TestSupport.hpp"
#include "anchorfit/common/Errors.hpp"
#include "anchorfit/data/EdgeExtractor.hpp"

using anchorfit::common::ConfigurationError;
using anchorfit::common::Rng;
using anchorfit::data::EdgeConvention;
using anchorfit::data::ExtractOptions;
using anchorfit::data::LabelDataset;
using anchorfit::data::extractEdges;
using anchorfit::data::parseEdgeConvention;
using anchorfit::data::polyToRotatedBox;
using anchorfit::tests::boxLabel;

namespace {

std::array<cv::Point2f, 4> rotatedRect(float cx, float cy, float w, float h, float deg) {
  cv::RotatedRect r(cv::Point2f(cx, cy), cv::Size2f(w, h), deg);
  cv::Point2f pts[4];
  r.points(pts);
  return {pts[0], pts[1], pts[2], pts[3]};
}

}  // namespace

TEST(EdgeExtractor, AxisAlignedKeepsHorizontalWidth) {
  const std::array<cv::Point2f, 4> poly = {cv::Point2f(10, 20), cv::Point2f(60, 20),
                                           cv::Point2f(60, 120), cv::Point2f(10, 120)};
  const auto box = polyToRotatedBox(poly, EdgeConvention::AxisAligned);
  EXPECT_NEAR(box.w, 50.0f, 1e-3f);
  EXPECT_NEAR(box.h, 100.0f, 1e-3f);
  EXPECT_NEAR(box.cx, 35.0f, 1e-3f);
  EXPECT_NEAR(box.cy, 70.0f, 1e-3f);
  EXPECT_NEAR(box.angle, 0.0f, 1e-4f);
}

TEST(EdgeExtractor, LongEdgePutsLongSideFirst) {
  const std::array<cv::Point2f, 4> poly = {cv::Point2f(10, 20), cv::Point2f(60, 20),
                                           cv::Point2f(60, 120), cv::Point2f(10, 120)};
  const auto box = polyToRotatedBox(poly, EdgeConvention::LongEdge);
  EXPECT_NEAR(box.w, 100.0f, 1e-3f);
  EXPECT_NEAR(box.h, 50.0f, 1e-3f);
  EXPECT_GE(box.angle, static_cast<float>(-CV_PI / 2) - 1e-5f);
  EXPECT_LT(box.angle, static_cast<float>(CV_PI / 2) + 1e-5f);
}

TEST(EdgeExtractor, RotatedPolygonEdgesSurvive) {
  for (float deg : {-80.0f, -30.0f, 15.0f, 44.0f, 70.0f}) {
    const auto poly = rotatedRect(200.0f, 150.0f, 80.0f, 30.0f, deg);
    const auto le = polyToRotatedBox(poly, EdgeConvention::LongEdge);
    EXPECT_NEAR(le.w, 80.0f, 0.05f) << "deg=" << deg;
    EXPECT_NEAR(le.h, 30.0f, 0.05f) << "deg=" << deg;

    const auto ax = polyToRotatedBox(poly, EdgeConvention::AxisAligned);
    EXPECT_NEAR(ax.w * ax.h, 2400.0f, 5.0f) << "deg=" << deg;
    EXPECT_GE(ax.angle, static_cast<float>(-CV_PI / 4) - 1e-5f);
    EXPECT_LT(ax.angle, static_cast<float>(CV_PI / 4) + 1e-5f);
  }
}

TEST(EdgeExtractor, ScalesEveryImageToImgSize) {
  LabelDataset dataset;
  dataset.shapes = {{640, 480}, {1024, 768}, {800, 800}};
  for (const auto& shape : dataset.shapes) {
    dataset.labels.push_back({boxLabel(shape, 640, 50.0f, 100.0f)});
  }

  ExtractOptions options;
  options.img_size = 640;
  options.convention = EdgeConvention::AxisAligned;
  Rng rng(1);
  const auto edges = extractEdges(dataset, options, rng);

  ASSERT_EQ(edges.unfiltered.size(), 3u);
  ASSERT_EQ(edges.filtered.size(), 3u);
  EXPECT_EQ(edges.small_count, 0u);
  for (const auto& e : edges.unfiltered) {
    EXPECT_NEAR(e.w, 50.0f, 1e-2f);
    EXPECT_NEAR(e.h, 100.0f, 1e-2f);
  }
}

TEST(EdgeExtractor, FiltersBoxesWithBothEdgesSmall) {
  const anchorfit::data::ImageShape shape{640, 640};
  LabelDataset dataset;
  dataset.shapes = {shape};
  dataset.labels = {{boxLabel(shape, 640, 3.0f, 4.0f), boxLabel(shape, 640, 3.0f, 40.0f),
                     boxLabel(shape, 640, 30.0f, 40.0f)}};

  ExtractOptions options;
  options.convention = EdgeConvention::AxisAligned;
  Rng rng(1);
  const auto edges = extractEdges(dataset, options, rng);

  EXPECT_EQ(edges.unfiltered.size(), 3u);
  EXPECT_EQ(edges.filtered.size(), 2u);
  // either edge small counts for the warning
  EXPECT_EQ(edges.small_count, 2u);
}

TEST(EdgeExtractor, AugmentationJittersWithinTenPercent) {
  const anchorfit::data::ImageShape shape{640, 640};
  LabelDataset dataset;
  for (int i = 0; i < 100; ++i) {
    dataset.shapes.push_back(shape);
    dataset.labels.push_back({boxLabel(shape, 640, 100.0f, 100.0f)});
  }

  ExtractOptions options;
  options.augment = true;
  Rng rng(12);
  const auto edges = extractEdges(dataset, options, rng);

  bool any_changed = false;
  for (const auto& e : edges.unfiltered) {
    EXPECT_GE(e.w, 90.0f - 1e-2f);
    EXPECT_LE(e.w, 110.0f + 1e-2f);
    EXPECT_NEAR(e.w, e.h, 1e-2f);
    any_changed = any_changed || std::fabs(e.w - 100.0f) > 0.1f;
  }
  EXPECT_TRUE(any_changed);
}

TEST(EdgeExtractor, MismatchedDatasetThrows) {
  LabelDataset dataset;
  dataset.shapes = {{640, 640}, {640, 640}};
  dataset.labels.resize(1);
  Rng rng(1);
  EXPECT_THROW(extractEdges(dataset, ExtractOptions{}, rng), ConfigurationError);
}

TEST(EdgeExtractor, ParsesConventionNames) {
  EXPECT_EQ(parseEdgeConvention("long_edge"), EdgeConvention::LongEdge);
  EXPECT_EQ(parseEdgeConvention(" Axis_Aligned "), EdgeConvention::AxisAligned);
  EXPECT_THROW(parseEdgeConvention("diagonal"), ConfigurationError);
}
