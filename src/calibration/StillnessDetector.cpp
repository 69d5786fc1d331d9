/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "calibration/StillnessDetector.h"

#include <cmath>

namespace GRAVCAL::CALIBRATION
{
StillnessDetector::StillnessDetector(double sd_crit) : m_sdCrit(sd_crit)
{
}

bool StillnessDetector::IsStill(const Vec3& mean, const Vec3& stddev) const
{
  for (std::size_t axis = 0; axis < 3; ++axis)
  {
    // NaN stddev (single-sample window) fails this comparison
    if (!(stddev[axis] < m_sdCrit))
      return false;

    if (!(std::abs(mean[axis]) < kMaxStillMeanG))
      return false;
  }

  return true;
}

StillnessDetector::Result StillnessDetector::Detect(const STATS::WindowStatistics& stats) const
{
  Result out;
  out.mask.reserve(stats.Size());

  for (std::size_t row = 0; row < stats.Size(); ++row)
  {
    const bool still = IsStill(stats.mean[row], stats.stddev[row]);
    out.mask.push_back(still);
    if (still)
      out.still_means.push_back(stats.mean[row]);
  }

  return out;
}
} // namespace GRAVCAL::CALIBRATION
