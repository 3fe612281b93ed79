// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_image.cpp
 *
 * Tests for the image container and rank normalization.
 */

#include <gtest/gtest.h>

#include <stdexcept>

#include "volalign/exceptions.hpp"
#include "volalign/image.hpp"

using namespace volalign;

// ─── Construction ────────────────────────────────────────────────────────────

TEST(ImageTest, DefaultIsEmpty) {
  Image image;
  EXPECT_TRUE(image.empty());
  EXPECT_EQ(image.rank(), 0);
}

TEST(ImageTest, FillConstructor) {
  Image image({2, 3, 4}, 1.5f);
  EXPECT_EQ(image.rank(), 3);
  EXPECT_EQ(image.size(), 24);
  for (const float v : image.values()) EXPECT_FLOAT_EQ(v, 1.5f);
}

TEST(ImageTest, DataSizeMismatchThrows) {
  EXPECT_THROW(Image({2, 2, 2}, std::vector<float>(7, 0.0f)),
               InvalidImageError);
}

TEST(ImageTest, NegativeExtentThrows) {
  EXPECT_THROW(Image({2, -1, 2}), InvalidImageError);
}

TEST(ImageTest, OverflowingShapeThrows) {
  const Index huge = Index{1} << 32;
  EXPECT_THROW(Image({huge, huge, 1}), InvalidImageError);
  EXPECT_THROW(Image({huge, huge, 1}, std::vector<float>{}),
               InvalidImageError);
}

TEST(ImageTest, ZeroExtentHasNoElements) {
  Image image({0, 4, 4});
  EXPECT_TRUE(image.empty());
  EXPECT_EQ(image.size(), 0);
}

TEST(ImageTest, FillOverwritesAllValues) {
  Image image({2, 3, 4}, 1.0f);
  image(1, 2, 3) = 5.0f;
  image.fill(-2.0f);
  EXPECT_EQ(image, Image({2, 3, 4}, -2.0f));
}

TEST(ImageTest, RowMajorIndexing) {
  std::vector<float> data(24);
  for (int i = 0; i < 24; ++i) data[i] = static_cast<float>(i);
  Image image({2, 3, 4}, data);

  // Last axis is contiguous
  EXPECT_FLOAT_EQ(image(0, 0, 1), 1.0f);
  EXPECT_FLOAT_EQ(image(0, 1, 0), 4.0f);
  EXPECT_FLOAT_EQ(image(1, 0, 0), 12.0f);
  EXPECT_FLOAT_EQ(image(1, 2, 3), 23.0f);
  EXPECT_FLOAT_EQ(image.at({1, 2, 3}), 23.0f);
}

TEST(ImageTest, OutOfRangeIndexThrows) {
  Image image({2, 3, 4});
  EXPECT_THROW(image(2, 0, 0), std::out_of_range);
  EXPECT_THROW(image(0, 0), std::out_of_range);
  EXPECT_THROW(image.at({0, -1, 0}), std::out_of_range);
}

TEST(ImageTest, Equality) {
  Image a({2, 2, 2}, 1.0f);
  Image b({2, 2, 2}, 1.0f);
  EXPECT_EQ(a, b);
  b(1, 1, 1) = 2.0f;
  EXPECT_NE(a, b);
  EXPECT_NE(a, Image({1, 2, 2, 2}, 1.0f));
}

// ─── Canonical shape ─────────────────────────────────────────────────────────

TEST(CanonicalShapeTest, PadsLeadingAxes) {
  const CanonicalShape s3 = canonicalShape({4, 5, 6});
  const CanonicalShape s4 = canonicalShape({3, 4, 5, 6});
  const CanonicalShape s5 = canonicalShape({2, 3, 4, 5, 6});
  EXPECT_EQ(s3, (CanonicalShape{1, 1, 4, 5, 6}));
  EXPECT_EQ(s4, (CanonicalShape{1, 3, 4, 5, 6}));
  EXPECT_EQ(s5, (CanonicalShape{2, 3, 4, 5, 6}));
}

TEST(CanonicalShapeTest, BadRankThrows) {
  EXPECT_THROW(canonicalShape({1, 1}), InvalidImageError);
  EXPECT_THROW(canonicalShape({1, 1, 1, 1, 1, 1}), InvalidImageError);
}

TEST(CanonicalShapeTest, EmptyAxisThrows) {
  EXPECT_THROW(canonicalShape({0, 4, 4}), InvalidImageError);
  EXPECT_THROW(canonicalShape({2, 0, 4, 4}), InvalidImageError);
}

TEST(CanonicalShapeTest, ErrorNamesOperation) {
  try {
    canonicalShape({3, 3});
    FAIL() << "expected InvalidImageError";
  } catch (const InvalidImageError& e) {
    EXPECT_EQ(e.getOperation(), "canonicalShape");
    EXPECT_NE(std::string(e.what()).find("(3, 3)"), std::string::npos);
  }
}

TEST(ToStringTest, Formats) {
  EXPECT_EQ(toString(Shape{3, 10, 10, 10}), "(3, 10, 10, 10)");
  EXPECT_EQ(toString(Shape{5}), "(5,)");
  EXPECT_EQ(toString(Shape{}), "()");
}

// ─── Leading axes ────────────────────────────────────────────────────────────

class LeadingAxesTest : public ::testing::Test {
 protected:
  Image image{Shape{2, 3, 2, 2, 2}};

  void SetUp() override {
    for (int b = 0; b < 2; ++b)
      for (int c = 0; c < 3; ++c)
        for (int z = 0; z < 2; ++z)
          for (int y = 0; y < 2; ++y)
            for (int x = 0; x < 2; ++x)
              image(b, c, z, y, x) = static_cast<float>(10 * b + c);
  }
};

TEST_F(LeadingAxesTest, SpatialShapeAndCount) {
  EXPECT_EQ(image.spatialShape(), (Shape{2, 2, 2}));
  EXPECT_EQ(image.leadingCount(), 6);
}

TEST_F(LeadingAxesTest, VolumeOrder) {
  // Volumes follow row-major order of (batch, channel)
  EXPECT_FLOAT_EQ(image.volume(0)(1, 1, 1), 0.0f);
  EXPECT_FLOAT_EQ(image.volume(2)(0, 0, 0), 2.0f);
  EXPECT_FLOAT_EQ(image.volume(4)(0, 1, 0), 11.0f);
  EXPECT_EQ(image.volume(5).shape(), (Shape{2, 2, 2}));
  EXPECT_THROW(image.volumeTensor(6), std::out_of_range);
}

TEST_F(LeadingAxesTest, MeanOverLeading) {
  const Image mean = image.meanOverLeading();
  ASSERT_EQ(mean.shape(), (Shape{2, 2, 2}));
  // mean of {0, 1, 2, 10, 11, 12}
  for (const float v : mean.values()) EXPECT_NEAR(v, 6.0f, 1e-5);
}

TEST_F(LeadingAxesTest, ExpandDims) {
  const Image expanded = image.volume(1).expandDims();
  EXPECT_EQ(expanded.shape(), (Shape{1, 2, 2, 2}));
  EXPECT_EQ(expanded.values(), image.volume(1).values());
}

TEST(ImageTest, FromVolumeCopiesData) {
  Volume volume(2, 3, 4);
  volume.setZero();
  volume(1, 2, 3) = 7.0f;
  const Image image = Image::fromVolume(volume);
  EXPECT_EQ(image.shape(), (Shape{2, 3, 4}));
  EXPECT_FLOAT_EQ(image(1, 2, 3), 7.0f);
}
