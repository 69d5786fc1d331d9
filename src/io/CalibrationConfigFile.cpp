/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "io/CalibrationConfigFile.h"

#include <cstdint>
#include <fstream>

#include <yaml-cpp/yaml.h>

namespace GRAVCAL::IO
{
namespace
{
bool ReadOptionalDouble(const YAML::Node& root, const char* key, double& value)
{
  const YAML::Node node = root[key];
  if (!node)
    return true;

  if (!node.IsScalar())
    return false;

  value = node.as<double>();
  return true;
}
} // namespace

bool CalibrationConfigFile::Load(const std::filesystem::path& path,
                                 CALIBRATION::CalibrationConfig& out) const
{
  m_lastError.clear();

  if (!std::filesystem::exists(path))
  {
    m_lastError = "File not found: " + path.string();
    return false;
  }

  CALIBRATION::CalibrationConfig config = out;

  try
  {
    const YAML::Node root = YAML::LoadFile(path.string());
    if (root.IsNull())
    {
      // Empty file keeps every default
      return true;
    }

    if (!root.IsMap())
    {
      m_lastError = "Top level is not a map";
      return false;
    }

    if (!ReadOptionalDouble(root, "sphere_crit", config.sphere_crit) ||
        !ReadOptionalDouble(root, "min_hours", config.min_hours) ||
        !ReadOptionalDouble(root, "sd_crit", config.sd_crit) ||
        !ReadOptionalDouble(root, "tol", config.tol))
    {
      m_lastError = "Expected a scalar value";
      return false;
    }

    const YAML::Node max_iter = root["max_iter"];
    if (max_iter)
    {
      if (!max_iter.IsScalar())
      {
        m_lastError = "Expected a scalar value for max_iter";
        return false;
      }
      config.max_iter = static_cast<std::size_t>(max_iter.as<std::uint64_t>());
    }
  }
  catch (const YAML::Exception& e)
  {
    m_lastError = e.what();
    return false;
  }

  out = config;
  return true;
}

bool CalibrationConfigFile::Save(const std::filesystem::path& path,
                                 const CALIBRATION::CalibrationConfig& config) const
{
  std::error_code ec;
  if (path.has_parent_path())
  {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
      return false;
  }

  YAML::Node root;
  root["sphere_crit"] = config.sphere_crit;
  root["min_hours"] = config.min_hours;
  root["sd_crit"] = config.sd_crit;
  root["max_iter"] = static_cast<std::uint64_t>(config.max_iter);
  root["tol"] = config.tol;

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.is_open())
    return false;

  f << root;
  f << "\n";
  return static_cast<bool>(f);
}
} // namespace GRAVCAL::IO
