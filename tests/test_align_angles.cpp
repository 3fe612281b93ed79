// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_align_angles.cpp
 *
 * Tests for axis order parsing, plane rotations and the angle solver.
 */

#include <gtest/gtest.h>

#include <Eigen/Geometry>
#include <cmath>
#include <string>
#include <vector>

#include "volalign/alignment/align_angles.hpp"
#include "volalign/exceptions.hpp"

using namespace volalign;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

const std::vector<std::string> kAllOrders = {"xyz", "xzy", "yxz",
                                             "yzx", "zxy", "zyx"};

Image makeCell() {
  Image cell({3, 10, 10, 10});
  for (int c = 0; c < 3; ++c) {
    for (int x = 0; x < 10; ++x) cell(c, 5, 5, x) = 1.0f;
    for (int y = 0; y < 5; ++y) cell(c, 5, y, 5) = 1.0f;
    cell(c, 6, 5, 5) = 1.0f;
  }
  return cell;
}

}  // namespace

// ─── Axis order ──────────────────────────────────────────────────────────────

TEST(AxisOrderTest, DefaultIsZyx) {
  AxisOrder order;
  EXPECT_EQ(toString(order), "zyx");
  EXPECT_EQ(order.majorIndex(), 2);
  EXPECT_EQ(order.middleIndex(), 1);
  EXPECT_EQ(order.minorIndex(), 0);
}

TEST(AxisOrderTest, ParseAllPermutations) {
  for (const auto& text : kAllOrders) {
    EXPECT_EQ(toString(parseAxisOrder(text)), text);
  }
  const AxisOrder order = parseAxisOrder("yzx");
  EXPECT_EQ(order.majorIndex(), 1);
  EXPECT_EQ(order.middleIndex(), 2);
  EXPECT_EQ(order.minorIndex(), 0);
}

TEST(AxisOrderTest, InvalidStringsThrow) {
  EXPECT_THROW(parseAxisOrder("aaa"), InvalidAxisOrderError);
  EXPECT_THROW(parseAxisOrder("xxy"), InvalidAxisOrderError);
  EXPECT_THROW(parseAxisOrder("xy"), InvalidAxisOrderError);
  EXPECT_THROW(parseAxisOrder("xyzx"), InvalidAxisOrderError);
  EXPECT_THROW(parseAxisOrder("XYZ"), InvalidAxisOrderError);
  EXPECT_THROW(parseAxisOrder(""), InvalidAxisOrderError);
}

TEST(AxisOrderTest, ToChar) {
  EXPECT_EQ(toChar(AxisLabel::X), 'x');
  EXPECT_EQ(toChar(AxisLabel::Y), 'y');
  EXPECT_EQ(toChar(AxisLabel::Z), 'z');
}

// ─── Plane rotation ──────────────────────────────────────────────────────────

TEST(PlaneRotationTest, MatchesAngleAxis) {
  for (int axis = 0; axis < 3; ++axis) {
    for (const double deg : {-135.0, -30.0, 17.5, 60.0, 170.0}) {
      const Eigen::Matrix3d expected =
          Eigen::AngleAxisd(deg * M_PI / 180.0, Eigen::Vector3d::Unit(axis))
              .toRotationMatrix();
      EXPECT_TRUE(rotationMatrix(PlaneRotation{axis, deg})
                      .isApprox(expected, 1e-12))
          << "axis " << axis << " deg " << deg;
    }
  }
}

TEST(PlaneRotationTest, QuarterTurnsAreExact) {
  const Eigen::Matrix3d R = rotationMatrix(PlaneRotation{2, 90.0});
  const Eigen::Vector3d turned = R * Eigen::Vector3d::UnitX();
  EXPECT_TRUE(turned == Eigen::Vector3d::UnitY());
  EXPECT_EQ(cosDeg(-90.0), 0.0);
  EXPECT_EQ(sinDeg(270.0), -1.0);
  EXPECT_EQ(cosDeg(180.0), -1.0);
  EXPECT_EQ(sinDeg(360.0), 0.0);
}

TEST(PlaneRotationTest, SequenceComposesInOrder) {
  const RotationAngles angles = {{2, 30.0}, {0, -45.0}, {1, 12.0}};
  const Eigen::Matrix3d expected = rotationMatrix(angles[2]) *
                                   rotationMatrix(angles[1]) *
                                   rotationMatrix(angles[0]);
  EXPECT_TRUE(rotationMatrix(angles).isApprox(expected, 1e-12));
}

TEST(PlaneRotationTest, ValidateRejectsBadEntries) {
  EXPECT_NO_THROW(validateRotations({{0, 10.0}, {2, -90.0}}));
  EXPECT_THROW(validateRotations({{3, 10.0}}), ValidationError);
  EXPECT_THROW(validateRotations({{-1, 10.0}}), ValidationError);
  EXPECT_THROW(validateRotations({{1, NAN}}), ValidationError);
}

// ─── Angle solver ────────────────────────────────────────────────────────────

TEST(PlaneAlignAngleTest, FoldedIntoHalfOpenRange) {
  // Projection already on target
  EXPECT_NEAR(planeAlignAngle(Eigen::Vector3d(1, 0, 0), 2, 0), 0.0, 1e-12);
  // Opposite direction is the same axis
  EXPECT_NEAR(planeAlignAngle(Eigen::Vector3d(-1, 0, 0), 2, 0), 0.0, 1e-12);
  // 45 degrees off in the xy plane
  EXPECT_NEAR(planeAlignAngle(Eigen::Vector3d(1, 1, 0), 2, 0), -45.0, 1e-12);
  EXPECT_NEAR(planeAlignAngle(Eigen::Vector3d(1, 1, 0), 2, 1), 45.0, 1e-12);
  // Perpendicular gives +90, never -90
  EXPECT_NEAR(planeAlignAngle(Eigen::Vector3d(0, 1, 0), 2, 0), 90.0, 1e-12);
  EXPECT_NEAR(planeAlignAngle(Eigen::Vector3d(0, -1, 0), 2, 0), 90.0, 1e-12);
}

TEST(PlaneAlignAngleTest, VanishingProjectionIsZero) {
  EXPECT_EQ(planeAlignAngle(Eigen::Vector3d(0, 0, 1), 2, 0), 0.0);
}

TEST(ComputeAlignAnglesTest, SequenceAxes) {
  const auto angles = computeAlignAngles(
      Eigen::Vector3d::UnitX(), Eigen::Vector3d::UnitZ(), parseAxisOrder("zyx"));
  ASSERT_EQ(angles.size(), 3u);
  EXPECT_EQ(angles[0].axis, 0);  // minor target
  EXPECT_EQ(angles[1].axis, 1);  // middle target
  EXPECT_EQ(angles[2].axis, 2);  // major target
  for (const auto& r : angles) {
    EXPECT_GT(r.degrees, -90.0);
    EXPECT_LE(r.degrees, 90.0);
  }
}

TEST(ComputeAlignAnglesTest, AlignsArbitraryFrame) {
  const Eigen::Matrix3d frame =
      (Eigen::AngleAxisd(0.4, Eigen::Vector3d(1, 2, 3).normalized()) *
       Eigen::AngleAxisd(-1.1, Eigen::Vector3d(-2, 0.5, 1).normalized()))
          .toRotationMatrix();
  const Eigen::Vector3d major = frame.col(0);
  const Eigen::Vector3d minor = frame.col(1);

  for (const auto& text : kAllOrders) {
    const AxisOrder order = parseAxisOrder(text);
    const Eigen::Matrix3d R =
        rotationMatrix(computeAlignAngles(major, minor, order));
    const Eigen::Vector3d major_r = R * major;
    const Eigen::Vector3d minor_r = R * minor;
    EXPECT_NEAR(std::abs(major_r(order.majorIndex())), 1.0, 1e-9) << text;
    EXPECT_NEAR(std::abs(minor_r(order.minorIndex())), 1.0, 1e-9) << text;
  }
}

TEST(GetAlignAnglesTest, InvariantToLeadingAxes) {
  const Image cell = makeCell();
  for (const auto& text : kAllOrders) {
    const auto a3 = getAlignAngles(cell.meanOverLeading(), text);
    const auto a4 = getAlignAngles(cell, text);
    const auto a5 = getAlignAngles(cell.expandDims(), text);
    ASSERT_EQ(a3.size(), 3u);
    EXPECT_EQ(a3, a4) << text;
    EXPECT_EQ(a4, a5) << text;
  }
}

TEST(GetAlignAnglesTest, DefaultOrderIsZyx) {
  const Image cell = makeCell();
  EXPECT_EQ(getAlignAngles(cell), getAlignAngles(cell, "zyx"));
}

TEST(GetAlignAnglesTest, Errors) {
  EXPECT_THROW(getAlignAngles(makeCell(), "aaa"), InvalidAxisOrderError);
  EXPECT_THROW(getAlignAngles(Image({1, 1}, 1.0f)), InvalidImageError);
  EXPECT_THROW(getAlignAngles(Image({4, 4, 4})), EmptyImageError);
}
