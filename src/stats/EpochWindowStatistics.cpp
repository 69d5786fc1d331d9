/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "stats/EpochWindowStatistics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace GRAVCAL::STATS
{
namespace
{
struct EpochAccumulator
{
  double epoch_start_s{0.0};
  Vec3 sum{0.0, 0.0, 0.0};
  Vec3 sum_sq{0.0, 0.0, 0.0};
  Vec3 shift{0.0, 0.0, 0.0};
  std::size_t count{0};

  void Start(double start_s, const Vec3& first)
  {
    epoch_start_s = start_s;
    sum = {0.0, 0.0, 0.0};
    sum_sq = {0.0, 0.0, 0.0};
    // Shifted sums keep the variance stable when |mean| >> stddev
    shift = first;
    count = 0;
  }

  void Add(const Vec3& sample)
  {
    for (std::size_t axis = 0; axis < 3; ++axis)
    {
      const double d = sample[axis] - shift[axis];
      sum[axis] += d;
      sum_sq[axis] += d * d;
    }
    ++count;
  }

  void Emit(WindowStatistics& out) const
  {
    const double n = static_cast<double>(count);

    Vec3 mean{0.0, 0.0, 0.0};
    Vec3 stddev{0.0, 0.0, 0.0};
    for (std::size_t axis = 0; axis < 3; ++axis)
    {
      mean[axis] = shift[axis] + sum[axis] / n;

      if (count < 2)
      {
        stddev[axis] = std::numeric_limits<double>::quiet_NaN();
        continue;
      }

      // Units: samples
      // Meaning: unbiased sample variance normalization (n - 1)
      const double denom = n - 1.0;

      const double var = (sum_sq[axis] - sum[axis] * sum[axis] / n) / denom;
      stddev[axis] = std::sqrt(std::max(var, 0.0));
    }

    out.time_s.push_back(epoch_start_s);
    out.mean.push_back(mean);
    out.stddev.push_back(stddev);
  }
};
} // namespace

WindowStatistics EpochWindowStatistics::Compute(const AccelTable& accel,
                                                const TimeSequence& time_s,
                                                std::size_t sample_count,
                                                double window_seconds) const
{
  if (!(window_seconds > 0.0))
    throw std::invalid_argument("Window length must be positive");

  if (sample_count > accel.size() || sample_count > time_s.size())
    throw std::invalid_argument("Window statistics requested past the end of the recording");

  WindowStatistics out;
  if (sample_count == 0)
    return out;

  EpochAccumulator epoch;
  double current_epoch = std::floor(time_s[0] / window_seconds);
  epoch.Start(current_epoch * window_seconds, accel[0]);

  for (std::size_t i = 0; i < sample_count; ++i)
  {
    const double epoch_index = std::floor(time_s[i] / window_seconds);
    if (epoch_index != current_epoch)
    {
      epoch.Emit(out);
      current_epoch = epoch_index;
      epoch.Start(current_epoch * window_seconds, accel[i]);
    }

    epoch.Add(accel[i]);
  }

  epoch.Emit(out);

  return out;
}
} // namespace GRAVCAL::STATS
