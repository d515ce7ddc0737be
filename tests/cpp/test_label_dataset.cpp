#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "TestSupport.hpp"
#include "anchorfit/common/Errors.hpp"
#include "anchorfit/data/LabelDataset.hpp"

namespace fs = std::filesystem;

using anchorfit::common::ConfigurationError;
using anchorfit::data::ImageShape;
using anchorfit::data::LabelDataset;
using anchorfit::data::parseDotaLine;
using anchorfit::data::readShapes;
using anchorfit::tests::RecordingLogger;

namespace {

class LabelDatasetTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    root_ = fs::temp_directory_path() / ("anchorfit_dataset_" + std::to_string(rd()));
    fs::create_directories(root_ / "labelTxt");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void write(const fs::path& relative, const std::string& content) {
    std::ofstream out(root_ / relative);
    out << content;
  }

  std::string path(const std::string& relative) const { return (root_ / relative).string(); }

  fs::path root_;
};

}  // namespace

TEST_F(LabelDatasetTest, LoadsDotaLabels) {
  write("data.yaml", "train: labelTxt\nnames: [plane, ship]\n");
  write("labelTxt.shapes", "P0001 1000 500\nP0002.png 800 800\n");
  write("labelTxt/P0001.txt",
        "imagesource:GoogleEarth\n"
        "gsd:0.146\n"
        "100 50 300 50 300 250 100 250 ship 0\n"
        "10 10 20 10 20 20 10 20 helicopter 1\n");
  write("labelTxt/P0002.txt", "0 0 80 0 80 40 0 40 plane 0\n\n");

  RecordingLogger logger;
  const LabelDataset dataset = LabelDataset::fromYaml(path("data.yaml"), logger);

  ASSERT_EQ(dataset.size(), 2u);
  ASSERT_EQ(dataset.names.size(), 2u);
  EXPECT_EQ(dataset.shapes[0].width, 1000);
  EXPECT_EQ(dataset.shapes[0].height, 500);
  ASSERT_EQ(dataset.labels[0].size(), 1u);
  EXPECT_EQ(dataset.labels[0][0].class_id, 1);
  EXPECT_NEAR(dataset.labels[0][0].poly[0].x, 0.1f, 1e-6f);
  EXPECT_NEAR(dataset.labels[0][0].poly[2].y, 0.5f, 1e-6f);
  ASSERT_EQ(dataset.labels[1].size(), 1u);
  EXPECT_EQ(dataset.labels[1][0].class_id, 0);
  EXPECT_EQ(dataset.numLabels(), 2u);
  EXPECT_TRUE(logger.contains("Skipped 1"));
}

TEST_F(LabelDatasetTest, ExplicitShapesAndRootPath) {
  fs::create_directories(root_ / "dota" / "train");
  write("data.yaml", "path: dota\ntrain: train\nshapes: sizes.txt\nnames: {0: plane}\n");
  write("dota/sizes.txt", "# stem width height\nimg1 640 640\n");
  write("dota/train/img1.txt", "0 0 64 0 64 64 0 64 plane\n");

  RecordingLogger logger;
  const LabelDataset dataset = LabelDataset::fromYaml(path("data.yaml"), logger);
  ASSERT_EQ(dataset.size(), 1u);
  EXPECT_EQ(dataset.labels[0].size(), 1u);
}

TEST_F(LabelDatasetTest, LabelFilesWithoutShapeAreIgnored) {
  write("data.yaml", "train: labelTxt\n");
  write("labelTxt.shapes", "a 100 100\n");
  write("labelTxt/a.txt", "0 0 10 0 10 10 0 10 3\n");
  write("labelTxt/b.txt", "0 0 10 0 10 10 0 10 3\n");

  RecordingLogger logger;
  const LabelDataset dataset = LabelDataset::fromYaml(path("data.yaml"), logger);
  ASSERT_EQ(dataset.size(), 1u);
  EXPECT_EQ(dataset.labels[0][0].class_id, 3);
  EXPECT_TRUE(logger.contains("were ignored"));
}

TEST_F(LabelDatasetTest, MissingConfigThrows) {
  RecordingLogger logger;
  EXPECT_THROW(LabelDataset::fromYaml(path("nope.yaml"), logger), ConfigurationError);
}

TEST_F(LabelDatasetTest, MissingTrainEntryThrows) {
  write("data.yaml", "val: labelTxt\n");
  RecordingLogger logger;
  EXPECT_THROW(LabelDataset::fromYaml(path("data.yaml"), logger), ConfigurationError);
}

TEST_F(LabelDatasetTest, MissingLabelDirectoryThrows) {
  write("data.yaml", "train: does_not_exist\n");
  RecordingLogger logger;
  EXPECT_THROW(LabelDataset::fromYaml(path("data.yaml"), logger), ConfigurationError);
}

TEST_F(LabelDatasetTest, MalformedShapesThrow) {
  write("bad.shapes", "img1 640\n");
  EXPECT_THROW(readShapes(path("bad.shapes")), ConfigurationError);
}

TEST(LabelDataset, ParseDotaLineRejectsShortLines) {
  const ImageShape shape{100, 100};
  EXPECT_FALSE(parseDotaLine("1 2 3 4", shape, {}).has_value());
  EXPECT_FALSE(parseDotaLine("a b c d e f g h plane", shape, {{"plane", 0}}).has_value());
  EXPECT_FALSE(parseDotaLine("0 0 1 0 1 1 0 1 -2", shape, {}).has_value());
  EXPECT_TRUE(parseDotaLine("0 0 1 0 1 1 0 1 2", shape, {}).has_value());
}

TEST(LabelDataset, ParseDotaLineRejectsNonFiniteCoordinates) {
  const ImageShape shape{100, 100};
  EXPECT_FALSE(parseDotaLine("nan 0 10 0 10 10 0 10 1", shape, {}).has_value());
  EXPECT_FALSE(parseDotaLine("0 0 inf 0 10 10 0 10 1", shape, {}).has_value());
  EXPECT_FALSE(parseDotaLine("0 0 12abc 0 10 10 0 10 1", shape, {}).has_value());

  const auto record = parseDotaLine("0 0 12.5 0 12.5 50 0 50 1", shape, {});
  ASSERT_TRUE(record.has_value());
  EXPECT_NEAR(record->poly[1].x, 0.125f, 1e-6f);
}

TEST(LabelDataset, ValidateRejectsMismatch) {
  LabelDataset dataset;
  dataset.shapes = {{10, 10}};
  EXPECT_THROW(dataset.validate(), ConfigurationError);
  dataset.labels.resize(1);
  EXPECT_NO_THROW(dataset.validate());
  dataset.shapes[0].width = 0;
  EXPECT_THROW(dataset.validate(), ConfigurationError);
}
