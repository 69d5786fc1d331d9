/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "calibration/CalibrationTypes.h"
#include "stats/WindowStatistics.h"

#include <vector>

namespace GRAVCAL::CALIBRATION
{
/*!
 * \brief No-motion classifier for window statistics
 *
 * A window is still when, on every axis, the standard deviation is below
 * the configured limit and the mean magnitude is below kMaxStillMeanG.
 */
class StillnessDetector
{
public:
  /*!
   * \brief Upper bound on |mean| for a still axis
   *
   * Units: g
   */
  static constexpr double kMaxStillMeanG = 2.0;

  struct Result
  {
    /*!
     * \brief One flag per statistics row, true where the window is still
     */
    std::vector<bool> mask;

    /*!
     * \brief Window means of the still rows, in row order
     *
     * Units: g
     */
    std::vector<Vec3> still_means;
  };

  explicit StillnessDetector(double sd_crit);

  bool IsStill(const Vec3& mean, const Vec3& stddev) const;

  Result Detect(const STATS::WindowStatistics& stats) const;

private:
  // Units: g
  double m_sdCrit;
};
} // namespace GRAVCAL::CALIBRATION
