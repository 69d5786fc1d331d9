/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "io/RecordingCsvFile.h"

#include "utils/StringUtils.h"

#include <array>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

using namespace GRAVCAL;
using namespace IO;

namespace
{
constexpr const char* CSV_HEADER = "time_s,x,y,z";

// Values per row: time, x, y, z
constexpr std::size_t FIELD_COUNT = 4;

// Digits written per value, enough to round-trip a double
constexpr int WRITE_PRECISION = 17;
} // namespace

bool RecordingCsvFile::Load(const std::filesystem::path& path,
                            double sampling_rate_hz,
                            RecordingData& out) const
{
  m_lastError.clear();

  std::ifstream f(path);
  if (!f.is_open())
  {
    m_lastError = "Unable to open " + path.string();
    return false;
  }

  RecordingData recording;
  recording.sampling_rate_hz = sampling_rate_hz;

  std::string line;
  std::size_t lineNumber = 0;
  while (std::getline(f, line))
  {
    ++lineNumber;

    const std::string trimmed = UTILS::StringUtils::Trim(line);
    if (trimmed.empty())
      continue;

    const std::vector<std::string> fields = UTILS::StringUtils::Split(trimmed, ',');

    std::array<double, FIELD_COUNT> values{};
    bool numeric = fields.size() == FIELD_COUNT;
    for (std::size_t i = 0; numeric && i < FIELD_COUNT; ++i)
      numeric = UTILS::StringUtils::ParseDouble(fields[i], values[i]);

    if (!numeric)
    {
      // Only the first line may be a header
      if (lineNumber == 1)
        continue;

      std::ostringstream msg;
      msg << path.string() << ":" << lineNumber << ": expected " << FIELD_COUNT
          << " numeric fields";
      m_lastError = msg.str();
      return false;
    }

    recording.time_s.push_back(values[0]);
    recording.acceleration.push_back({values[1], values[2], values[3]});
  }

  out = std::move(recording);
  return true;
}

bool RecordingCsvFile::Save(const std::filesystem::path& path,
                            const TimeSequence& time_s,
                            const AccelTable& accel) const
{
  m_lastError.clear();

  if (time_s.size() != accel.size())
  {
    m_lastError = "Time and acceleration row counts differ";
    return false;
  }

  std::error_code ec;
  if (path.has_parent_path())
  {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
    {
      m_lastError = ec.message();
      return false;
    }
  }

  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f.is_open())
  {
    m_lastError = "Unable to open " + path.string();
    return false;
  }

  f << CSV_HEADER << "\n";
  f << std::setprecision(WRITE_PRECISION);
  for (std::size_t i = 0; i < time_s.size(); ++i)
    f << time_s[i] << "," << accel[i][0] << "," << accel[i][1] << "," << accel[i][2] << "\n";

  return static_cast<bool>(f);
}
