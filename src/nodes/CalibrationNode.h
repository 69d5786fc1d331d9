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

#include <string>

#include <rclcpp/node.hpp>

namespace GRAVCAL
{
namespace ROS
{

/*!
 * \brief Batch calibration of one recording
 *
 * Reads a raw CSV recording, runs sphere calibration once, logs the
 * advisories and writes the calibrated CSV and a YAML report.
 */
class CalibrationNode : public rclcpp::Node
{
public:
  CalibrationNode();

  bool Initialize();
  bool Run();
  void Deinitialize();

private:
  void LogDiagnostics(const CALIBRATION::CalibrationResult& result);

  // File parameters
  std::string m_inputCsv;
  std::string m_outputCsv;
  std::string m_reportYaml;
  std::string m_configYaml;

  // Recording parameters
  double m_samplingRateHz{0.0};
  bool m_debugLogging{false};

  // Calibration parameters
  CALIBRATION::CalibrationConfig m_config;
};

} // namespace ROS
} // namespace GRAVCAL
