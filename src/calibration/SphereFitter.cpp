/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "calibration/SphereFitter.h"

#include "calibration/StillnessDetector.h"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <utility>

#include <Eigen/Dense>

namespace GRAVCAL::CALIBRATION
{
namespace
{
// Calibration errors are reported to 5 decimal places
constexpr double kErrorRoundingScale = 1e5;

#ifndef GRAVCAL_CAL_DEBUG
#define GRAVCAL_CAL_DEBUG 0
#endif

struct LineFit
{
  double intercept{0.0};
  double slope{1.0};
};

// Weighted least squares y ~ intercept + slope * x. A constant x gives a
// zero slope, matching the minimum-norm solution.
LineFit WeightedLineFit(const Eigen::VectorXd& x,
                        const Eigen::VectorXd& y,
                        const Eigen::VectorXd& w)
{
  const double weight_sum = w.sum();
  const double x_mean = w.dot(x) / weight_sum;
  const double y_mean = w.dot(y) / weight_sum;

  const Eigen::ArrayXd dx = x.array() - x_mean;
  const Eigen::ArrayXd dy = y.array() - y_mean;

  const double sxx = (w.array() * dx * dx).sum();
  const double sxy = (w.array() * dx * dy).sum();

  LineFit fit;
  fit.slope = sxx > 0.0 ? sxy / sxx : 0.0;
  fit.intercept = y_mean - fit.slope * x_mean;

  return fit;
}

SphereFitter::SampleMatrix ApplyParameters(const SphereFitter::SampleMatrix& samples,
                                           const Eigen::RowVector3d& scale,
                                           const Eigen::RowVector3d& offset)
{
  return ((samples.array().rowwise() * scale.array()).rowwise() + offset.array()).matrix();
}

Vec3 ToVec3(const Eigen::RowVector3d& value)
{
  return {value.x(), value.y(), value.z()};
}
} // namespace

SphereFitter::SphereFitter(const CalibrationConfig& config,
                           const STATS::IWindowStatistics& statistics)
  : m_config(config), m_statistics(statistics)
{
}

SphereFitter::Result SphereFitter::Fit(const AccelTable& accel,
                                       const TimeSequence& time_s,
                                       std::size_t sample_count) const
{
  const STATS::WindowStatistics stats =
      m_statistics.Compute(accel, time_s, sample_count, kWindowSeconds);

  const StillnessDetector detector(m_config.sd_crit);
  const StillnessDetector::Result stillness = detector.Detect(stats);

  if constexpr (GRAVCAL_CAL_DEBUG)
  {
    std::cerr << "[SphereFit] samples=" << sample_count << " windows=" << stats.Size()
              << " still=" << stillness.still_means.size() << "\n";
  }

  return FitStillSamples(stillness.still_means);
}

SphereFitter::Result SphereFitter::FitStillSamples(const std::vector<Vec3>& still_means) const
{
  Result out;
  out.still_count = still_means.size();

  const Eigen::Index sample_count = static_cast<Eigen::Index>(still_means.size());
  SampleMatrix still(sample_count, 3);
  for (Eigen::Index row = 0; row < sample_count; ++row)
  {
    const Vec3& mean = still_means[static_cast<std::size_t>(row)];
    still.row(row) << mean[0], mean[1], mean[2];
  }

  if (!HasSphereCoverage(still, m_config.sphere_crit))
  {
    out.outcome = FitOutcome::SPHERE_UNDERPOPULATED;
    return out;
  }

  out.cal_error_start = CalibrationError(still);

  FitState state = InitialState(sample_count);
  for (std::size_t iteration = 0; iteration < m_config.max_iter; ++iteration)
  {
    state = Iterate(still, std::move(state));
    ++out.iterations;

    // History index trails the newest round by one because of the
    // +infinity seed, so the first usable comparison is at iteration 2
    const std::vector<double>& history = state.residual_history;
    if (iteration > 0 && std::abs(history[iteration] - history[iteration - 1]) < m_config.tol)
      break;
  }

  out.offset = ToVec3(state.offset);
  out.scale = ToVec3(state.scale);
  out.residual_history = std::move(state.residual_history);
  out.cal_error_end = CalibrationError(ApplyParameters(still, state.scale, state.offset));

  out.accepted =
      out.cal_error_end < out.cal_error_start && out.cal_error_end < kMaxAcceptedErrorG;
  out.outcome = out.accepted ? FitOutcome::ACCEPTED : FitOutcome::ERROR_NOT_IMPROVED;

  if constexpr (GRAVCAL_CAL_DEBUG)
  {
    std::cerr << std::fixed << std::setprecision(6);
    std::cerr << "[SphereFit] iterations=" << out.iterations << " scale=[" << state.scale
              << "] offset=[" << state.offset << "] err_start=" << out.cal_error_start
              << " err_end=" << out.cal_error_end << " " << ToString(out.outcome) << "\n";
  }

  return out;
}

bool SphereFitter::HasSphereCoverage(const SampleMatrix& samples, double sphere_crit)
{
  if (samples.rows() == 0)
    return false;

  const Eigen::RowVector3d min_values = samples.colwise().minCoeff();
  const Eigen::RowVector3d max_values = samples.colwise().maxCoeff();

  std::size_t covered_axes = 0;
  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    if (min_values(axis) < -sphere_crit && max_values(axis) > sphere_crit)
      ++covered_axes;
  }

  return covered_axes == 3;
}

double SphereFitter::CalibrationError(const SampleMatrix& samples)
{
  const double error = (samples.rowwise().norm().array() - 1.0).abs().mean();

  // Round half to even under the default rounding mode
  return std::nearbyint(error * kErrorRoundingScale) / kErrorRoundingScale;
}

SphereFitter::FitState SphereFitter::InitialState(Eigen::Index sample_count)
{
  FitState state;
  state.offset.setZero();
  state.scale.setOnes();
  state.weights = Eigen::VectorXd::Constant(sample_count, kInitialWeight);
  state.residual_history.assign(1, std::numeric_limits<double>::infinity());

  return state;
}

SphereFitter::FitState SphereFitter::Iterate(const SampleMatrix& still, FitState state)
{
  SampleMatrix curr = ApplyParameters(still, state.scale, state.offset);

  const Eigen::VectorXd norms = curr.rowwise().norm();
  const SampleMatrix closest_point = (curr.array().colwise() / norms.array()).matrix();

  Eigen::RowVector3d offset_change = Eigen::RowVector3d::Zero();
  Eigen::RowVector3d scale_change = Eigen::RowVector3d::Ones();

  for (Eigen::Index axis = 0; axis < 3; ++axis)
  {
    const Eigen::VectorXd x = curr.col(axis);
    const Eigen::VectorXd y = closest_point.col(axis);

    const LineFit fit = WeightedLineFit(x, y, state.weights);
    offset_change(axis) = fit.intercept;
    scale_change(axis) = fit.slope;

    curr.col(axis) = (x.array() * fit.slope + fit.intercept).matrix();
  }

  state.scale = scale_change.cwiseProduct(state.scale);
  state.offset = offset_change + state.offset.cwiseQuotient(state.scale);

  const SampleMatrix diff = curr - closest_point;
  const double weight_sum = state.weights.sum();

  // Units: g^2
  // Meaning: weighted mean squared distance to the sphere
  const double residual =
      3.0 * ((diff.array().square().colwise() * state.weights.array()) / weight_sum).mean();
  state.residual_history.push_back(residual);

  // Inliers gain weight, capped so exact hits do not dominate
  state.weights = diff.rowwise().norm().cwiseInverse().cwiseMin(kMaxWeight);

  return state;
}
} // namespace GRAVCAL::CALIBRATION
