// Tests for obstacle inflation and the distance field

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>

#include "grid_fixtures.hpp"
#include "topomap/grid_preprocessor.hpp"

using topomap::GridPreprocessor;
using topomap_test::makeGrid;

TEST(GridPreprocessorTest, UnknownAndOccupiedCellsAreObstacles)
{
  auto grid = makeGrid(4, 1);
  grid.data = {0, -1, 50, 100};

  GridPreprocessor pre(0, 1);
  cv::Mat mask = pre.obstacleMask(grid);

  ASSERT_EQ(mask.rows, 1);
  ASSERT_EQ(mask.cols, 4);
  EXPECT_EQ(mask.at<uchar>(0, 0), 0);
  EXPECT_EQ(mask.at<uchar>(0, 1), 255);
  EXPECT_EQ(mask.at<uchar>(0, 2), 255);
  EXPECT_EQ(mask.at<uchar>(0, 3), 255);
}

TEST(GridPreprocessorTest, OccupiedThresholdIsConfigurable)
{
  auto grid = makeGrid(3, 1);
  grid.data = {10, 64, 65};

  GridPreprocessor pre(0, 65);
  cv::Mat mask = pre.obstacleMask(grid);

  EXPECT_EQ(mask.at<uchar>(0, 0), 0);
  EXPECT_EQ(mask.at<uchar>(0, 1), 0);
  EXPECT_EQ(mask.at<uchar>(0, 2), 255);
}

TEST(GridPreprocessorTest, DilationUsesSquareOfGivenHalfWidth)
{
  cv::Mat mask = cv::Mat::zeros(21, 21, CV_8UC1);
  mask.at<uchar>(10, 10) = 255;

  GridPreprocessor pre(2, 1);
  cv::Mat dilated = pre.dilate(mask);

  EXPECT_EQ(cv::countNonZero(dilated), 25);
  EXPECT_EQ(dilated.at<uchar>(8, 8), 255);
  EXPECT_EQ(dilated.at<uchar>(12, 12), 255);
  EXPECT_EQ(dilated.at<uchar>(7, 10), 0);
  EXPECT_EQ(dilated.at<uchar>(10, 13), 0);
}

TEST(GridPreprocessorTest, ZeroHalfWidthKeepsMask)
{
  cv::Mat mask = cv::Mat::zeros(5, 5, CV_8UC1);
  mask.at<uchar>(2, 3) = 255;

  GridPreprocessor pre(0, 1);
  cv::Mat dilated = pre.dilate(mask);

  EXPECT_EQ(cv::countNonZero(dilated), 1);
  EXPECT_EQ(dilated.at<uchar>(2, 3), 255);
}

TEST(GridPreprocessorTest, DilationDoesNotWrapAroundBorders)
{
  cv::Mat mask = cv::Mat::zeros(10, 10, CV_8UC1);
  mask.at<uchar>(0, 0) = 255;

  GridPreprocessor pre(1, 1);
  cv::Mat dilated = pre.dilate(mask);

  EXPECT_EQ(cv::countNonZero(dilated), 4);
  EXPECT_EQ(dilated.at<uchar>(9, 9), 0);
  EXPECT_EQ(dilated.at<uchar>(0, 9), 0);
}

TEST(GridPreprocessorTest, DistanceFieldIsExactEuclidean)
{
  auto grid = makeGrid(20, 20);
  grid.data[0] = 100;  // cell (0, 0)

  GridPreprocessor pre(0, 1);
  cv::Mat field = pre.distanceField(grid);

  ASSERT_EQ(field.type(), CV_32FC1);
  ASSERT_EQ(field.rows, 20);
  ASSERT_EQ(field.cols, 20);
  EXPECT_FLOAT_EQ(field.at<float>(0, 0), 0.0f);
  EXPECT_NEAR(field.at<float>(4, 3), 5.0f, 1e-4);
  EXPECT_NEAR(field.at<float>(7, 7), std::sqrt(98.0f), 1e-4);
  EXPECT_NEAR(field.at<float>(0, 19), 19.0f, 1e-4);
}

TEST(GridPreprocessorTest, DistanceIsMeasuredFromInflatedObstacles)
{
  auto grid = makeGrid(30, 30);
  grid.data[15 + 15 * 30] = 100;

  GridPreprocessor pre(3, 1);
  cv::Mat field = pre.distanceField(grid);

  // Inflated square spans [12, 18]; (15, 22) is 4 cells below its edge
  EXPECT_FLOAT_EQ(field.at<float>(18, 15), 0.0f);
  EXPECT_NEAR(field.at<float>(22, 15), 4.0f, 1e-4);
}

TEST(GridPreprocessorTest, UnknownCellsProduceZeroDistance)
{
  auto grid = makeGrid(10, 10);
  grid.data[5 + 5 * 10] = -1;

  GridPreprocessor pre(0, 1);
  cv::Mat field = pre.distanceField(grid);

  EXPECT_FLOAT_EQ(field.at<float>(5, 5), 0.0f);
  EXPECT_NEAR(field.at<float>(8, 5), 3.0f, 1e-4);
}

TEST(GridPreprocessorTest, ObstacleFreeGridIsUnbounded)
{
  auto grid = makeGrid(10, 10);

  GridPreprocessor pre(40, 1);
  cv::Mat field = pre.distanceField(grid);

  for (int y = 0; y < field.rows; ++y) {
    for (int x = 0; x < field.cols; ++x) {
      EXPECT_TRUE(std::isinf(field.at<float>(y, x)));
    }
  }
}

TEST(GridPreprocessorTest, InconsistentGridThrows)
{
  auto grid = makeGrid(10, 10);
  grid.data.resize(99);

  GridPreprocessor pre(0, 1);
  EXPECT_THROW(pre.distanceField(grid), std::invalid_argument);
}

TEST(GridPreprocessorTest, NegativeHalfWidthRejected)
{
  EXPECT_THROW(GridPreprocessor(-1, 1), std::invalid_argument);
}
