/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "calibration/CalibrationTypes.h"

#include <filesystem>
#include <string>

namespace GRAVCAL::IO
{
/*!
 * \brief Raw recordings as comma-separated text
 *
 * Layout: an optional header line, then one "time_s,x,y,z" row per sample
 * with acceleration in g.
 */
class RecordingCsvFile
{
public:
  bool Load(const std::filesystem::path& path, double sampling_rate_hz, RecordingData& out) const;

  bool Save(const std::filesystem::path& path,
            const TimeSequence& time_s,
            const AccelTable& accel) const;

  // Description of the last failure, including the line number when parsing
  const std::string& GetLastError() const { return m_lastError; }

private:
  mutable std::string m_lastError;
};
} // namespace GRAVCAL::IO
