#include <gtest/gtest.h>

#include <random>
#include <vector>

#include "anchorfit/anchor/AnchorFitness.hpp"
#include "anchorfit/common/Errors.hpp"

using anchorfit::anchor::AnchorList;
using anchorfit::anchor::BoxEdge;
using anchorfit::anchor::anchorFitness;
using anchorfit::anchor::bestFit;
using anchorfit::anchor::evaluateFit;
using anchorfit::anchor::ratioMetric;
using anchorfit::anchor::toEdgeMatrix;

TEST(AnchorFitness, RatioMetricUsesWorstEdge) {
  const AnchorList anchors = {{10.0f, 20.0f}, {40.0f, 10.0f}};
  const std::vector<BoxEdge> boxes = {{20.0f, 20.0f}};

  const cv::Mat metric = ratioMetric(anchors, toEdgeMatrix(boxes));
  ASSERT_EQ(metric.rows, 1);
  ASSERT_EQ(metric.cols, 2);
  // (20/10, 20/20) -> min(0.5, 1.0)
  EXPECT_NEAR(metric.at<float>(0, 0), 0.5f, 1e-6f);
  // (20/40, 20/10) -> min(0.5, 0.5)
  EXPECT_NEAR(metric.at<float>(0, 1), 0.5f, 1e-6f);
}

TEST(AnchorFitness, BestFitTakesRowMaximum) {
  const AnchorList anchors = {{10.0f, 10.0f}, {30.0f, 60.0f}};
  const std::vector<BoxEdge> boxes = {{10.0f, 10.0f}, {30.0f, 30.0f}};

  const cv::Mat best = bestFit(ratioMetric(anchors, toEdgeMatrix(boxes)));
  ASSERT_EQ(best.rows, 2);
  EXPECT_NEAR(best.at<float>(0), 1.0f, 1e-6f);
  EXPECT_NEAR(best.at<float>(1), 0.5f, 1e-6f);
}

TEST(AnchorFitness, ExactMatchesGiveFullRecall) {
  const AnchorList anchors = {{12.0f, 16.0f}, {50.0f, 100.0f}, {200.0f, 90.0f}};
  std::vector<BoxEdge> boxes;
  for (int i = 0; i < 10; ++i) {
    boxes.push_back(anchors[i % anchors.size()]);
  }

  for (float thr : {1.0f, 2.0f, 4.0f, 10.0f}) {
    const auto report = evaluateFit(anchors, boxes, thr);
    EXPECT_DOUBLE_EQ(report.best_possible_recall, 1.0) << "thr=" << thr;
  }
}

TEST(AnchorFitness, CountsAnchorsAboveThreshold) {
  const AnchorList anchors = {{10.0f, 10.0f}, {20.0f, 20.0f}, {200.0f, 200.0f}};
  const std::vector<BoxEdge> boxes = {{10.0f, 10.0f}, {400.0f, 400.0f}};

  const auto report = evaluateFit(anchors, boxes, 4.0f);
  // box 0 fits anchors 0 and 1, box 1 fits anchor 2 only
  EXPECT_DOUBLE_EQ(report.anchors_above_threshold, 1.5);
  EXPECT_DOUBLE_EQ(report.best_possible_recall, 1.0);
}

TEST(AnchorFitness, MissedBoxLowersRecall) {
  const AnchorList anchors = {{10.0f, 10.0f}};
  const std::vector<BoxEdge> boxes = {{10.0f, 10.0f}, {12.0f, 9.0f}, {100.0f, 5.0f}, {2.0f, 2.0f}};

  const auto report = evaluateFit(anchors, boxes, 4.0f);
  EXPECT_DOUBLE_EQ(report.best_possible_recall, 0.5);
}

TEST(AnchorFitness, ReportStaysInRangeForRandomInput) {
  std::mt19937 rng(42);
  std::uniform_real_distribution<float> edge(0.0f, 500.0f);
  std::uniform_real_distribution<float> anchor_edge(2.0f, 400.0f);

  for (int t = 0; t < 50; ++t) {
    AnchorList anchors(9);
    for (auto& a : anchors) a = {anchor_edge(rng), anchor_edge(rng)};
    std::vector<BoxEdge> boxes(37);
    for (auto& b : boxes) b = {edge(rng), edge(rng)};

    const auto report = evaluateFit(anchors, boxes, 4.0f);
    EXPECT_GE(report.best_possible_recall, 0.0);
    EXPECT_LE(report.best_possible_recall, 1.0);
    EXPECT_GE(report.anchors_above_threshold, 0.0);
    EXPECT_LE(report.anchors_above_threshold, 9.0);
  }
}

TEST(AnchorFitness, ZeroEdgeBoxScoresZero) {
  const AnchorList anchors = {{10.0f, 10.0f}};
  const std::vector<BoxEdge> boxes = {{0.0f, 10.0f}};
  const cv::Mat metric = ratioMetric(anchors, toEdgeMatrix(boxes));
  EXPECT_FLOAT_EQ(metric.at<float>(0, 0), 0.0f);
}

TEST(AnchorFitness, EmptyBoxesRaiseDataError) {
  const AnchorList anchors = {{10.0f, 10.0f}};
  EXPECT_THROW(evaluateFit(anchors, {}, 4.0f), anchorfit::common::DataError);
}

TEST(AnchorFitness, FitnessIgnoresBoxesBelowThreshold) {
  const AnchorList anchors = {{10.0f, 10.0f}};
  // best scores: 1.0, 0.5, 0.1
  const std::vector<BoxEdge> boxes = {{10.0f, 10.0f}, {20.0f, 20.0f}, {100.0f, 100.0f}};
  const double fitness = anchorFitness(anchors, toEdgeMatrix(boxes), 0.25f);
  EXPECT_NEAR(fitness, (1.0 + 0.5 + 0.0) / 3.0, 1e-6);
}
