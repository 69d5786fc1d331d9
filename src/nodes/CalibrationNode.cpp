/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "CalibrationNode.h"

#include "calibration/SphereCalibrator.h"
#include "io/CalibrationConfigFile.h"
#include "io/CalibrationReportFile.h"
#include "io/RecordingCsvFile.h"
#include "utils/LogUtils.h"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>

#include <rclcpp/rclcpp.hpp>

using namespace GRAVCAL;
using namespace ROS;

namespace
{
// Default node name
constexpr const char* NODE_NAME = "gravcal_calibrate";

// ROS parameters
constexpr const char* INPUT_CSV_PARAMETER = "input_csv";
constexpr const char* OUTPUT_CSV_PARAMETER = "output_csv";
constexpr const char* REPORT_YAML_PARAMETER = "report_yaml";
constexpr const char* CONFIG_YAML_PARAMETER = "config_yaml";
constexpr const char* SAMPLING_RATE_PARAMETER = "sampling_rate_hz";
constexpr const char* DEBUG_LOGGING_PARAMETER = "debug_logging";

constexpr double DEFAULT_SAMPLING_RATE_HZ = 50.0;
} // namespace

CalibrationNode::CalibrationNode() : rclcpp::Node(NODE_NAME)
{
  const CALIBRATION::CalibrationConfig defaults;

  declare_parameter(INPUT_CSV_PARAMETER, std::string());
  declare_parameter(OUTPUT_CSV_PARAMETER, std::string());
  declare_parameter(REPORT_YAML_PARAMETER, IO::CalibrationReportFile::DefaultFilename());
  declare_parameter(CONFIG_YAML_PARAMETER, std::string());
  declare_parameter(SAMPLING_RATE_PARAMETER, DEFAULT_SAMPLING_RATE_HZ);
  declare_parameter(DEBUG_LOGGING_PARAMETER, false);

  declare_parameter("sphere_crit", defaults.sphere_crit);
  declare_parameter("min_hours", defaults.min_hours);
  declare_parameter("sd_crit", defaults.sd_crit);
  declare_parameter("max_iter", static_cast<int64_t>(defaults.max_iter));
  declare_parameter("tol", defaults.tol);
}

bool CalibrationNode::Initialize()
{
  m_inputCsv = get_parameter(INPUT_CSV_PARAMETER).as_string();
  m_outputCsv = get_parameter(OUTPUT_CSV_PARAMETER).as_string();
  m_reportYaml = get_parameter(REPORT_YAML_PARAMETER).as_string();
  m_configYaml = get_parameter(CONFIG_YAML_PARAMETER).as_string();
  m_samplingRateHz = get_parameter(SAMPLING_RATE_PARAMETER).as_double();
  m_debugLogging = get_parameter(DEBUG_LOGGING_PARAMETER).as_bool();

  UTILS::LogUtils::InitializeLogging(shared_from_this(), m_debugLogging);

  if (m_inputCsv.empty())
  {
    RCLCPP_ERROR(get_logger(), "Parameter '%s' is required", INPUT_CSV_PARAMETER);
    return false;
  }

  // A config file replaces the individual calibration parameters
  if (!m_configYaml.empty())
  {
    IO::CalibrationConfigFile configFile;
    if (!configFile.Load(m_configYaml, m_config))
    {
      RCLCPP_ERROR(get_logger(), "Failed to load config %s: %s", m_configYaml.c_str(),
                   configFile.GetLastError().c_str());
      return false;
    }

    RCLCPP_INFO(get_logger(), "Loaded calibration config: %s", m_configYaml.c_str());
  }
  else
  {
    const int64_t maxIter = get_parameter("max_iter").as_int();
    if (maxIter < 0)
    {
      RCLCPP_ERROR(get_logger(), "Parameter 'max_iter' must not be negative");
      return false;
    }

    m_config.sphere_crit = get_parameter("sphere_crit").as_double();
    m_config.min_hours = get_parameter("min_hours").as_double();
    m_config.sd_crit = get_parameter("sd_crit").as_double();
    m_config.max_iter = static_cast<std::size_t>(maxIter);
    m_config.tol = get_parameter("tol").as_double();
  }

  RCLCPP_INFO(get_logger(),
              "Calibration parameters: sphere_crit=%.3f g, min_hours=%.1f, sd_crit=%.4f g, "
              "max_iter=%zu, tol=%g",
              m_config.sphere_crit, m_config.min_hours, m_config.sd_crit, m_config.max_iter,
              m_config.tol);

  return true;
}

bool CalibrationNode::Run()
{
  IO::RecordingCsvFile csvFile;

  RecordingData recording;
  if (!csvFile.Load(m_inputCsv, m_samplingRateHz, recording))
  {
    RCLCPP_ERROR(get_logger(), "Failed to load recording: %s", csvFile.GetLastError().c_str());
    return false;
  }

  RCLCPP_INFO(get_logger(), "Loaded %zu samples at %.2f Hz from %s",
              recording.acceleration.size(), m_samplingRateHz, m_inputCsv.c_str());

  const CALIBRATION::SphereCalibrator calibrator(m_config);

  CALIBRATION::CalibrationResult result;
  try
  {
    result = calibrator.Calibrate(std::move(recording));
  }
  catch (const std::invalid_argument& e)
  {
    RCLCPP_ERROR(get_logger(), "Invalid recording: %s", e.what());
    return false;
  }

  LogDiagnostics(result);

  for (const CALIBRATION::FitAttempt& attempt : result.attempts)
  {
    RCLCPP_DEBUG(get_logger(), "Fit over %.1f hours: %s (error %.5f -> %.5f g)",
                 attempt.window_hours, CALIBRATION::ToString(attempt.outcome),
                 attempt.cal_error_start, attempt.cal_error_end);
  }

  if (result.status == CALIBRATION::CalibrationStatus::CALIBRATED)
  {
    RCLCPP_INFO(get_logger(), "Scale: [%.6f, %.6f, %.6f], offset: [%.6f, %.6f, %.6f] g",
                result.scale[0], result.scale[1], result.scale[2], result.offset[0],
                result.offset[1], result.offset[2]);
  }

  if (!m_outputCsv.empty())
  {
    if (!csvFile.Save(m_outputCsv, result.time_s, result.cal_acceleration))
    {
      RCLCPP_ERROR(get_logger(), "Failed to write %s: %s", m_outputCsv.c_str(),
                   csvFile.GetLastError().c_str());
      return false;
    }

    RCLCPP_INFO(get_logger(), "Wrote calibrated recording: %s", m_outputCsv.c_str());
  }

  if (!m_reportYaml.empty())
  {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto createdUnixNs =
        static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());

    IO::CalibrationReportFile reportFile;
    if (!reportFile.Save(m_reportYaml, m_config, result, createdUnixNs))
    {
      RCLCPP_ERROR(get_logger(), "Failed to write report: %s", m_reportYaml.c_str());
      return false;
    }

    RCLCPP_INFO(get_logger(), "Wrote calibration report: %s", m_reportYaml.c_str());
  }

  return true;
}

void CalibrationNode::Deinitialize()
{
  m_config = CALIBRATION::CalibrationConfig{};
}

void CalibrationNode::LogDiagnostics(const CALIBRATION::CalibrationResult& result)
{
  for (const CALIBRATION::CalibrationDiagnostic& diagnostic : result.diagnostics)
  {
    switch (diagnostic.severity)
    {
      case CALIBRATION::DiagnosticSeverity::WARNING:
        RCLCPP_WARN(get_logger(), "%s", diagnostic.message.c_str());
        break;
      case CALIBRATION::DiagnosticSeverity::INFO:
      default:
        RCLCPP_INFO(get_logger(), "%s", diagnostic.message.c_str());
        break;
    }
  }
}
