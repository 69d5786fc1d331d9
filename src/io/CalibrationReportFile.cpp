/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "io/CalibrationReportFile.h"

#include <fstream>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace GRAVCAL::IO
{
namespace
{
YAML::Node WriteVec3(const Vec3& v)
{
  YAML::Node seq(YAML::NodeType::Sequence);
  for (double x : v)
    seq.push_back(x);
  return seq;
}

YAML::Node WriteConfig(const CALIBRATION::CalibrationConfig& config)
{
  YAML::Node node;
  node["sphere_crit"] = config.sphere_crit;
  node["min_hours"] = config.min_hours;
  node["sd_crit"] = config.sd_crit;
  node["max_iter"] = static_cast<std::uint64_t>(config.max_iter);
  node["tol"] = config.tol;
  return node;
}

YAML::Node WriteAttempts(const std::vector<CALIBRATION::FitAttempt>& attempts)
{
  YAML::Node seq(YAML::NodeType::Sequence);
  for (const CALIBRATION::FitAttempt& attempt : attempts)
  {
    YAML::Node node;
    node["window_samples"] = static_cast<std::uint64_t>(attempt.window_samples);
    node["window_hours"] = attempt.window_hours;
    node["outcome"] = CALIBRATION::ToString(attempt.outcome);
    node["cal_error_start_g"] = attempt.cal_error_start;
    node["cal_error_end_g"] = attempt.cal_error_end;
    seq.push_back(node);
  }
  return seq;
}

YAML::Node WriteDiagnostics(const std::vector<CALIBRATION::CalibrationDiagnostic>& diagnostics)
{
  YAML::Node seq(YAML::NodeType::Sequence);
  for (const CALIBRATION::CalibrationDiagnostic& diagnostic : diagnostics)
  {
    YAML::Node node;
    node["severity"] = CALIBRATION::ToString(diagnostic.severity);
    node["code"] = CALIBRATION::ToString(diagnostic.code);
    node["message"] = diagnostic.message;
    seq.push_back(node);
  }
  return seq;
}
} // namespace

bool CalibrationReportFile::Save(const std::filesystem::path& path,
                                 const CALIBRATION::CalibrationConfig& config,
                                 const CALIBRATION::CalibrationResult& result,
                                 std::uint64_t created_unix_ns) const
{
  std::error_code ec;
  if (path.has_parent_path())
  {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
      return false;
  }

  YAML::Node root;
  root["version"] = Version();
  root["created_unix_ns"] = created_unix_ns;
  root["status"] = CALIBRATION::ToString(result.status);
  root["sampling_rate_hz"] = result.sampling_rate_hz;
  root["sample_count"] = static_cast<std::uint64_t>(result.cal_acceleration.size());
  root["config"] = WriteConfig(config);

  YAML::Node calib;
  calib["scale"] = WriteVec3(result.scale);
  calib["offset_g"] = WriteVec3(result.offset);
  calib["cal_error_start_g"] = result.cal_error_start;
  calib["cal_error_end_g"] = result.cal_error_end;
  root["calibration"] = calib;

  root["attempts"] = WriteAttempts(result.attempts);
  root["diagnostics"] = WriteDiagnostics(result.diagnostics);

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.is_open())
    return false;

  f << root;
  f << "\n";
  return static_cast<bool>(f);
}

std::string CalibrationReportFile::DefaultFilename()
{
  return "gravcal_report.yaml";
}
} // namespace GRAVCAL::IO
