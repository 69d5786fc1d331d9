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

#include <cstdint>
#include <filesystem>
#include <string>

namespace GRAVCAL::IO
{
/*!
 * \brief Writes a human-readable summary of one calibration run
 *
 * The report records the parameters used, the fitted scale and offset and
 * every fit attempt. It is an output artifact only.
 */
class CalibrationReportFile
{
public:
  bool Save(const std::filesystem::path& path,
            const CALIBRATION::CalibrationConfig& config,
            const CALIBRATION::CalibrationResult& result,
            std::uint64_t created_unix_ns) const;

  static std::string DefaultFilename();
  static constexpr int Version() { return 1; }
};
} // namespace GRAVCAL::IO
