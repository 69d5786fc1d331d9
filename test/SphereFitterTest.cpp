/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "SyntheticRecording.h"
#include "calibration/SphereFitter.h"
#include "stats/EpochWindowStatistics.h"

#include <cmath>
#include <random>

#include <gtest/gtest.h>

using namespace GRAVCAL;
using namespace CALIBRATION;

namespace
{
// Four slightly perturbed copies of every sphere direction, distorted as
// raw = truth * scale + offset
std::vector<Vec3> MakeStillMeans(const Vec3& scale, const Vec3& offset)
{
  const std::vector<Vec3> directions = TEST::SphereDirections();
  const double perturbations[] = {-0.002, -0.001, 0.001, 0.002};

  std::vector<Vec3> means;
  for (const Vec3& dir : directions)
  {
    for (double p : perturbations)
    {
      Vec3 truth{dir[0] + p, dir[1] - p, dir[2] + 0.5 * p};
      const double norm = std::sqrt(truth[0] * truth[0] + truth[1] * truth[1] + truth[2] * truth[2]);

      Vec3 raw;
      for (std::size_t axis = 0; axis < 3; ++axis)
        raw[axis] = truth[axis] / norm * scale[axis] + offset[axis];
      means.push_back(raw);
    }
  }

  return means;
}

SphereFitter::SampleMatrix ToMatrix(const std::vector<Vec3>& rows)
{
  SphereFitter::SampleMatrix matrix(static_cast<Eigen::Index>(rows.size()), 3);
  for (std::size_t row = 0; row < rows.size(); ++row)
  {
    const auto r = static_cast<Eigen::Index>(row);
    matrix.row(r) << rows[row][0], rows[row][1], rows[row][2];
  }
  return matrix;
}

class SphereFitterTest : public ::testing::Test
{
protected:
  STATS::EpochWindowStatistics m_statistics;
  CalibrationConfig m_config;
};
} // namespace

TEST_F(SphereFitterTest, ZeroSignalIsUnderpopulated)
{
  RecordingData recording;
  recording.sampling_rate_hz = 1.0;
  for (std::size_t i = 0; i < 3600; ++i)
  {
    recording.acceleration.push_back({0.0, 0.0, 0.0});
    recording.time_s.push_back(static_cast<double>(i));
  }

  const SphereFitter fitter(m_config, m_statistics);
  const SphereFitter::Result result =
      fitter.Fit(recording.acceleration, recording.time_s, recording.acceleration.size());

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.outcome, FitOutcome::SPHERE_UNDERPOPULATED);
  EXPECT_EQ(result.iterations, 0u);
  EXPECT_EQ(result.still_count, 360u);
  EXPECT_DOUBLE_EQ(result.cal_error_start, 0.0);
  EXPECT_DOUBLE_EQ(result.cal_error_end, 0.0);
  for (std::size_t axis = 0; axis < 3; ++axis)
  {
    EXPECT_DOUBLE_EQ(result.scale[axis], 1.0);
    EXPECT_DOUBLE_EQ(result.offset[axis], 0.0);
  }
}

TEST_F(SphereFitterTest, SingleOrientationIsUnderpopulated)
{
  const std::vector<Vec3> still(50, Vec3{0.0, 0.0, 1.0});

  const SphereFitter::Result result = SphereFitter(m_config, m_statistics).FitStillSamples(still);

  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.outcome, FitOutcome::SPHERE_UNDERPOPULATED);
  EXPECT_EQ(result.iterations, 0u);
  EXPECT_TRUE(result.residual_history.empty());
}

TEST_F(SphereFitterTest, NoStillSamplesIsUnderpopulated)
{
  const SphereFitter::Result result =
      SphereFitter(m_config, m_statistics).FitStillSamples(std::vector<Vec3>{});

  EXPECT_EQ(result.outcome, FitOutcome::SPHERE_UNDERPOPULATED);
  EXPECT_EQ(result.still_count, 0u);
}

TEST_F(SphereFitterTest, CoverageNeedsBothSidesOfEveryAxis)
{
  SphereFitter::SampleMatrix samples(6, 3);
  samples << 1.0, 0.0, 0.0,
             -1.0, 0.0, 0.0,
             0.0, 1.0, 0.0,
             0.0, -1.0, 0.0,
             0.0, 0.0, 1.0,
             0.0, 0.0, -0.3;

  // -0.3 is not strictly below -0.3
  EXPECT_FALSE(SphereFitter::HasSphereCoverage(samples, 0.3));

  samples(5, 2) = -0.31;
  EXPECT_TRUE(SphereFitter::HasSphereCoverage(samples, 0.3));
  EXPECT_FALSE(SphereFitter::HasSphereCoverage(samples, 0.5));
}

TEST_F(SphereFitterTest, CalibrationErrorRoundsToFiveDecimals)
{
  SphereFitter::SampleMatrix samples(2, 3);
  samples << 1.0123456, 0.0, 0.0,
             0.0, -1.0123456, 0.0;

  EXPECT_DOUBLE_EQ(SphereFitter::CalibrationError(samples), 0.01235);

  samples << 1.0, 0.0, 0.0,
             0.0, 0.0, -1.0;
  EXPECT_DOUBLE_EQ(SphereFitter::CalibrationError(samples), 0.0);
}

TEST_F(SphereFitterTest, InitialStateStartsFromIdentity)
{
  const SphereFitter::FitState state = SphereFitter::InitialState(5);

  EXPECT_TRUE(state.offset.isZero());
  EXPECT_TRUE(state.scale.isOnes());
  ASSERT_EQ(state.weights.size(), 5);
  EXPECT_DOUBLE_EQ(state.weights.minCoeff(), SphereFitter::kInitialWeight);
  EXPECT_DOUBLE_EQ(state.weights.maxCoeff(), SphereFitter::kInitialWeight);
  ASSERT_EQ(state.residual_history.size(), 1u);
  EXPECT_TRUE(std::isinf(state.residual_history[0]));
}

TEST_F(SphereFitterTest, IterationComposesOffsetWithUpdatedScale)
{
  const SphereFitter::SampleMatrix still =
      ToMatrix(MakeStillMeans({1.02, 0.98, 1.01}, {0.01, -0.02, 0.0}));

  SphereFitter::FitState start = SphereFitter::InitialState(still.rows());
  start.scale << 1.01, 0.99, 1.005;
  start.offset << 0.004, -0.006, 0.001;

  // The same round seen from identity parameters on pre-transformed data
  // yields the raw increments
  const SphereFitter::SampleMatrix transformed =
      ((still.array().rowwise() * start.scale.array()).rowwise() + start.offset.array()).matrix();
  const SphereFitter::FitState increments =
      SphereFitter::Iterate(transformed, SphereFitter::InitialState(still.rows()));

  const SphereFitter::FitState next = SphereFitter::Iterate(still, start);

  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    const double expected_scale = increments.scale(axis) * start.scale(axis);
    const double expected_offset = increments.offset(axis) + start.offset(axis) / expected_scale;

    EXPECT_NEAR(next.scale(axis), expected_scale, 1e-12);
    EXPECT_NEAR(next.offset(axis), expected_offset, 1e-12);
  }

  ASSERT_EQ(next.residual_history.size(), 2u);
  EXPECT_TRUE(std::isinf(next.residual_history[0]));
  EXPECT_TRUE(std::isfinite(next.residual_history[1]));
  EXPECT_LE(next.weights.maxCoeff(), SphereFitter::kMaxWeight);
}

TEST_F(SphereFitterTest, ConvergesOnSlightlyDistortedData)
{
  const std::vector<Vec3> still = MakeStillMeans({1.005, 0.995, 1.0}, {0.002, -0.001, 0.0});

  const SphereFitter::Result result = SphereFitter(m_config, m_statistics).FitStillSamples(still);

  EXPECT_TRUE(result.accepted);
  EXPECT_EQ(result.outcome, FitOutcome::ACCEPTED);
  EXPECT_GT(result.cal_error_start, 0.0);
  EXPECT_LT(result.cal_error_end, result.cal_error_start);
  EXPECT_LT(result.cal_error_end, SphereFitter::kMaxAcceptedErrorG);

  EXPECT_NEAR(result.scale[0], 1.0 / 1.005, 0.01);
  EXPECT_NEAR(result.scale[1], 1.0 / 0.995, 0.01);
  EXPECT_NEAR(result.scale[2], 1.0, 0.01);
  for (std::size_t axis = 0; axis < 3; ++axis)
    EXPECT_NEAR(result.offset[axis], 0.0, 0.003);

  EXPECT_GT(result.iterations, 0u);
  EXPECT_LE(result.iterations, m_config.max_iter);
  EXPECT_EQ(result.residual_history.size(), result.iterations + 1);
}

TEST_F(SphereFitterTest, PerfectDataCannotImproveError)
{
  const std::vector<Vec3> still = MakeStillMeans({1.0, 1.0, 1.0}, {0.0, 0.0, 0.0});

  const SphereFitter::Result result = SphereFitter(m_config, m_statistics).FitStillSamples(still);

  EXPECT_DOUBLE_EQ(result.cal_error_start, 0.0);
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.outcome, FitOutcome::ERROR_NOT_IMPROVED);
}

TEST_F(SphereFitterTest, AcceptsNoisyCalibratedData)
{
  // Unit directions with white noise on the window means and a residual
  // distortion well inside sensor tolerance
  const Vec3 scale{1.0005, 0.9995, 1.0};
  const Vec3 offset{0.0005, -0.0005, 0.0};

  std::mt19937 rng(42);
  std::normal_distribution<double> noise(0.0, 0.0005);

  std::vector<Vec3> still;
  for (int copy = 0; copy < 20; ++copy)
  {
    for (const Vec3& dir : TEST::SphereDirections())
    {
      Vec3 mean;
      for (std::size_t axis = 0; axis < 3; ++axis)
        mean[axis] = (dir[axis] + noise(rng)) * scale[axis] + offset[axis];
      still.push_back(mean);
    }
  }
  ASSERT_EQ(still.size(), 520u);

  const SphereFitter::Result result = SphereFitter(m_config, m_statistics).FitStillSamples(still);

  EXPECT_TRUE(result.accepted);
  EXPECT_EQ(result.outcome, FitOutcome::ACCEPTED);
  EXPECT_LT(result.cal_error_end, result.cal_error_start);
  for (std::size_t axis = 0; axis < 3; ++axis)
  {
    EXPECT_NEAR(result.scale[axis], 1.0, 1e-3) << "axis " << axis;
    EXPECT_NEAR(result.offset[axis], 0.0, 1e-3) << "axis " << axis;
  }
}

TEST_F(SphereFitterTest, CalibratedRecordingBelowRoundingIsNotAccepted)
{
  // Window means land on the sphere to well under 5 decimals, so both errors
  // round to zero and the strict improvement rule cannot pass
  TEST::SyntheticRecordingBuilder builder(10.0);
  const std::vector<Vec3> directions = TEST::SphereDirections();
  for (std::size_t block = 0; block < 120; ++block)
  {
    builder.AddStill(directions[block % directions.size()], 120.0, 2e-5);
    builder.AddMovement(60.0);
  }
  const RecordingData recording = builder.Build();

  const SphereFitter::Result result =
      SphereFitter(m_config, m_statistics)
          .Fit(recording.acceleration, recording.time_s, recording.acceleration.size());

  EXPECT_GT(result.still_count, 0u);
  EXPECT_DOUBLE_EQ(result.cal_error_start, 0.0);
  EXPECT_DOUBLE_EQ(result.cal_error_end, 0.0);
  EXPECT_FALSE(result.accepted);
  EXPECT_EQ(result.outcome, FitOutcome::ERROR_NOT_IMPROVED);
  for (std::size_t axis = 0; axis < 3; ++axis)
  {
    EXPECT_NEAR(result.scale[axis], 1.0, 1e-3);
    EXPECT_NEAR(result.offset[axis], 0.0, 1e-3);
  }
}

TEST_F(SphereFitterTest, IterationLimitIsHonored)
{
  m_config.max_iter = 3;
  m_config.tol = 0.0;
  const std::vector<Vec3> still = MakeStillMeans({1.02, 0.98, 1.01}, {0.01, -0.02, 0.0});

  const SphereFitter::Result result = SphereFitter(m_config, m_statistics).FitStillSamples(still);

  EXPECT_EQ(result.iterations, 3u);
  EXPECT_EQ(result.residual_history.size(), 4u);
}

TEST_F(SphereFitterTest, ZeroIterationsKeepsIdentity)
{
  m_config.max_iter = 0;
  const std::vector<Vec3> still = MakeStillMeans({1.02, 0.98, 1.01}, {0.01, -0.02, 0.0});

  const SphereFitter::Result result = SphereFitter(m_config, m_statistics).FitStillSamples(still);

  EXPECT_EQ(result.iterations, 0u);
  EXPECT_DOUBLE_EQ(result.cal_error_end, result.cal_error_start);
  EXPECT_EQ(result.outcome, FitOutcome::ERROR_NOT_IMPROVED);
  EXPECT_DOUBLE_EQ(result.scale[0], 1.0);
  EXPECT_DOUBLE_EQ(result.offset[1], 0.0);
}

TEST_F(SphereFitterTest, FitsStillWindowsOfARecording)
{
  TEST::SyntheticRecordingBuilder builder(10.0);
  builder.AddOrientationCycle(6.0, 120.0, 60.0);
  const RecordingData recording = builder.Build({1.02, 0.98, 1.01}, {0.01, -0.02, 0.0});

  const SphereFitter::Result result =
      SphereFitter(m_config, m_statistics)
          .Fit(recording.acceleration, recording.time_s, recording.acceleration.size());

  EXPECT_GT(result.still_count, 0u);
  EXPECT_TRUE(result.accepted);
  EXPECT_GT(result.cal_error_start, 0.01);
  EXPECT_LT(result.cal_error_end, 0.01);
  EXPECT_NEAR(result.scale[0], 1.0 / 1.02, 0.01 / 1.02);
  EXPECT_NEAR(result.scale[1], 1.0 / 0.98, 0.01 / 0.98);
  EXPECT_NEAR(result.scale[2], 1.0 / 1.01, 0.01 / 1.01);
}
