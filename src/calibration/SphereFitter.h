/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "calibration/CalibrationConfig.h"
#include "calibration/CalibrationTypes.h"
#include "stats/IWindowStatistics.h"

#include <cstddef>
#include <vector>

#include <Eigen/Core>

namespace GRAVCAL::CALIBRATION
{
/*!
 * \brief Iterative closest-point fit of still samples to the unit sphere
 *
 * Still windows are found from 10 s window statistics. Their means are
 * repeatedly projected onto the unit sphere and a weighted line is fit per
 * axis from the current estimate to the projection. The line intercepts and
 * slopes are folded into a running per-axis offset and scale:
 *
 *   scale  <- scale_increment * scale
 *   offset <- offset_increment + offset / scale
 *
 * The offset update divides by the already-updated scale. Changing this
 * composition changes the numerical output of the fit.
 */
class SphereFitter
{
public:
  /*!
   * \brief Window length used for stillness statistics
   *
   * Units: seconds
   */
  static constexpr double kWindowSeconds = 10.0;

  /*!
   * \brief Calibration error a fit must reach to be accepted
   *
   * Units: g
   */
  static constexpr double kMaxAcceptedErrorG = 0.01;

  // Starting per-sample weight and the cap applied after each round
  static constexpr double kInitialWeight = 100.0;
  static constexpr double kMaxWeight = 100.0;

  using SampleMatrix = Eigen::Matrix<double, Eigen::Dynamic, 3>;

  /*!
   * \brief Loop state threaded through each closest-point round
   */
  struct FitState
  {
    Eigen::RowVector3d offset{Eigen::RowVector3d::Zero()};
    Eigen::RowVector3d scale{Eigen::RowVector3d::Ones()};

    // One weight per still sample
    Eigen::VectorXd weights;

    // Seeded with +infinity, one entry appended per round
    std::vector<double> residual_history;
  };

  struct Result
  {
    /*!
     * \brief True when the fit passed the acceptance rule
     */
    bool accepted{false};

    FitOutcome outcome{FitOutcome::SPHERE_UNDERPOPULATED};

    /*!
     * \brief Fitted per-axis offset, returned even when not accepted
     *
     * Units: g
     */
    Vec3 offset{0.0, 0.0, 0.0};

    /*!
     * \brief Fitted per-axis scale, returned even when not accepted
     */
    Vec3 scale{1.0, 1.0, 1.0};

    /*!
     * \brief Calibration error before and after the fit, 5 decimals
     *
     * Units: g
     */
    double cal_error_start{0.0};
    double cal_error_end{0.0};

    /*!
     * \brief Number of statistics windows classified as still
     */
    std::size_t still_count{0};

    /*!
     * \brief Number of closest-point rounds run
     */
    std::size_t iterations{0};

    std::vector<double> residual_history;
  };

  SphereFitter(const CalibrationConfig& config, const STATS::IWindowStatistics& statistics);

  /*!
   * \brief Fit the first sample_count rows of a recording
   */
  Result Fit(const AccelTable& accel, const TimeSequence& time_s, std::size_t sample_count) const;

  /*!
   * \brief Fit an already extracted set of still window means
   */
  Result FitStillSamples(const std::vector<Vec3>& still_means) const;

  /*!
   * \brief True when every axis reaches below -sphere_crit and above +sphere_crit
   */
  static bool HasSphereCoverage(const SampleMatrix& samples, double sphere_crit);

  /*!
   * \brief Mean absolute deviation of row norms from 1, rounded to 5 decimals
   */
  static double CalibrationError(const SampleMatrix& samples);

  static FitState InitialState(Eigen::Index sample_count);

  /*!
   * \brief Run one closest-point round and return the next state
   */
  static FitState Iterate(const SampleMatrix& still, FitState state);

private:
  CalibrationConfig m_config;
  const STATS::IWindowStatistics& m_statistics;
};
} // namespace GRAVCAL::CALIBRATION
