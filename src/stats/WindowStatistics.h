/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "calibration/CalibrationTypes.h"

#include <cstddef>
#include <vector>

namespace GRAVCAL::STATS
{
/*!
 * \brief Per-window acceleration statistics, one row per retained window
 *
 * All vectors have the same length.
 */
struct WindowStatistics
{
  /*!
   * \brief Window timestamp
   *
   * Units: seconds
   */
  std::vector<double> time_s;

  /*!
   * \brief Per-axis mean over the window
   *
   * Units: g
   */
  std::vector<Vec3> mean;

  /*!
   * \brief Per-axis sample standard deviation over the window
   *
   * Units: g. NaN when the window holds fewer than two samples.
   */
  std::vector<Vec3> stddev;

  std::size_t Size() const { return time_s.size(); }
};
} // namespace GRAVCAL::STATS
