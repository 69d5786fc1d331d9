/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "calibration/CalibrationConfig.h"

#include <filesystem>
#include <string>

namespace GRAVCAL::IO
{
/*!
 * \brief Loads and saves calibration parameters as YAML
 *
 * Every key is optional. Missing keys keep the value already present in the
 * output config, so a file only needs the parameters it overrides.
 *
 * Keys: sphere_crit, min_hours, sd_crit, max_iter, tol
 */
class CalibrationConfigFile
{
public:
  bool Load(const std::filesystem::path& path, CALIBRATION::CalibrationConfig& out) const;
  bool Save(const std::filesystem::path& path, const CALIBRATION::CalibrationConfig& config) const;

  // Description of the last Load() failure
  const std::string& GetLastError() const { return m_lastError; }

private:
  mutable std::string m_lastError;
};
} // namespace GRAVCAL::IO
