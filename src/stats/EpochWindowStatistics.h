/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "stats/IWindowStatistics.h"

namespace GRAVCAL::STATS
{
/*!
 * \brief Window statistics over fixed, non-overlapping time epochs
 *
 * Epoch k covers [k * W, (k + 1) * W) seconds, so epochs are aligned to
 * multiples of the window length W rather than to the first sample. One row
 * is produced per epoch that holds at least one sample, stamped with the
 * epoch start. Standard deviation uses the unbiased (n - 1) normalization.
 */
class EpochWindowStatistics : public IWindowStatistics
{
public:
  WindowStatistics Compute(const AccelTable& accel,
                           const TimeSequence& time_s,
                           std::size_t sample_count,
                           double window_seconds) const override;
};
} // namespace GRAVCAL::STATS
