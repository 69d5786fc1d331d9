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

#include <cstddef>

namespace GRAVCAL
{
namespace STATS
{

class IWindowStatistics
{
public:
  virtual ~IWindowStatistics() = default;

  // Meaning: mean and standard deviation per axis over windows of
  // window_seconds, computed on the first sample_count rows only. Edge
  // handling is up to the implementation.
  virtual WindowStatistics Compute(const AccelTable& accel,
                                   const TimeSequence& time_s,
                                   std::size_t sample_count,
                                   double window_seconds) const = 0;
};

} // namespace STATS
} // namespace GRAVCAL
