/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "calibration/SphereCalibrator.h"

#include "calibration/AffineTransform.h"
#include "calibration/SphereFitter.h"
#include "stats/EpochWindowStatistics.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace GRAVCAL::CALIBRATION
{
namespace
{
constexpr double kSecondsPerHour = 3600.0;

#ifndef GRAVCAL_CAL_DEBUG
#define GRAVCAL_CAL_DEBUG 0
#endif

CalibrationDiagnostic MakeDiagnostic(DiagnosticSeverity severity,
                                     CalibrationStatus code,
                                     const std::string& message)
{
  CalibrationDiagnostic diagnostic;
  diagnostic.severity = severity;
  diagnostic.code = code;
  diagnostic.message = message;
  return diagnostic;
}
} // namespace

SphereCalibrator::SphereCalibrator() : SphereCalibrator(CalibrationConfig{})
{
}

SphereCalibrator::SphereCalibrator(const CalibrationConfig& config)
  : SphereCalibrator(config, std::make_unique<STATS::EpochWindowStatistics>())
{
}

SphereCalibrator::SphereCalibrator(const CalibrationConfig& config,
                                   std::unique_ptr<STATS::IWindowStatistics> statistics)
  : m_config(config), m_statistics(std::move(statistics))
{
  if (!m_statistics)
    throw std::invalid_argument("A window statistics provider is required");
}

std::size_t SphereCalibrator::MinimumSamples(double min_hours, double sampling_rate_hz)
{
  return static_cast<std::size_t>(min_hours * kSecondsPerHour * sampling_rate_hz);
}

std::size_t SphereCalibrator::ExpansionSamples(double sampling_rate_hz)
{
  return static_cast<std::size_t>(kExpansionHours * kSecondsPerHour * sampling_rate_hz);
}

void SphereCalibrator::Validate(const RecordingData& recording) const
{
  const double fs = recording.sampling_rate_hz;
  if (!std::isfinite(fs) || fs <= 0.0)
  {
    std::ostringstream msg;
    msg << "Sampling rate must be positive and finite, got " << fs << " Hz";
    throw std::invalid_argument(msg.str());
  }

  if (recording.acceleration.size() != recording.time_s.size())
  {
    std::ostringstream msg;
    msg << "Acceleration has " << recording.acceleration.size() << " rows but time has "
        << recording.time_s.size() << " rows";
    throw std::invalid_argument(msg.str());
  }

  if (!std::isfinite(m_config.min_hours) || m_config.min_hours <= 0.0)
  {
    std::ostringstream msg;
    msg << "min_hours must be positive, got " << m_config.min_hours;
    throw std::invalid_argument(msg.str());
  }

  // Sample counts must fit in std::size_t before truncation
  const double max_samples = static_cast<double>(std::numeric_limits<std::size_t>::max());
  if (!(m_config.min_hours * kSecondsPerHour * fs < max_samples) ||
      !(kExpansionHours * kSecondsPerHour * fs < max_samples))
  {
    std::ostringstream msg;
    msg << "min_hours " << m_config.min_hours << " at " << fs
        << " Hz exceeds the addressable sample count";
    throw std::invalid_argument(msg.str());
  }

  if (ExpansionSamples(fs) == 0)
  {
    std::ostringstream msg;
    msg << "Sampling rate " << fs << " Hz is too low to hold one sample per "
        << kExpansionHours << " hour block";
    throw std::invalid_argument(msg.str());
  }

  const TimeSequence& time_s = recording.time_s;
  for (std::size_t i = 0; i < time_s.size(); ++i)
  {
    if (!std::isfinite(time_s[i]))
    {
      std::ostringstream msg;
      msg << "Timestamp at row " << i << " is not finite";
      throw std::invalid_argument(msg.str());
    }

    if (i > 0 && time_s[i] < time_s[i - 1])
    {
      std::ostringstream msg;
      msg << "Timestamps decrease at row " << i << " (" << time_s[i - 1] << " s -> "
          << time_s[i] << " s)";
      throw std::invalid_argument(msg.str());
    }
  }
}

CalibrationResult SphereCalibrator::Calibrate(RecordingData recording) const
{
  Validate(recording);

  const std::size_t total_samples = recording.acceleration.size();
  const double fs = recording.sampling_rate_hz;
  const std::size_t min_samples = MinimumSamples(m_config.min_hours, fs);
  const std::size_t expansion_samples = ExpansionSamples(fs);

  const SphereFitter fitter(m_config, *m_statistics);

  std::vector<FitAttempt> attempts;
  SphereFitter::Result final_fit;
  std::size_t window_index = 0;

  State state = total_samples < min_samples ? State::INSUFFICIENT : State::FITTING;

  // Bounded by total_samples / expansion_samples + 1 rounds
  while (state == State::FITTING)
  {
    const std::size_t window_end = min_samples + window_index * expansion_samples;
    const std::size_t window_samples = std::min(window_end, total_samples);

    SphereFitter::Result fit =
        fitter.Fit(recording.acceleration, recording.time_s, window_samples);

    FitAttempt attempt;
    attempt.window_samples = window_samples;
    attempt.window_hours = static_cast<double>(window_samples) / (fs * kSecondsPerHour);
    attempt.outcome = fit.outcome;
    attempt.cal_error_start = fit.cal_error_start;
    attempt.cal_error_end = fit.cal_error_end;
    attempts.push_back(attempt);

    if constexpr (GRAVCAL_CAL_DEBUG)
    {
      std::cerr << "[SphereCal] round=" << window_index << " samples=" << window_samples
                << " hours=" << attempt.window_hours << " " << ToString(fit.outcome) << "\n";
    }

    if (fit.accepted)
    {
      final_fit = std::move(fit);
      state = State::ACCEPTED;
    }
    else if (window_end >= total_samples)
    {
      state = State::INVALID;
    }
    else
    {
      ++window_index;
    }
  }

  switch (state)
  {
    case State::INSUFFICIENT:
    {
      const double available_hours = static_cast<double>(total_samples) / (fs * kSecondsPerHour);

      std::ostringstream msg;
      msg << "Less than " << m_config.min_hours << " hours of data (" << available_hours
          << " hours). No Calibration performed";

      CalibrationResult result =
          MakeUncalibratedResult(std::move(recording), CalibrationStatus::DATA_INSUFFICIENT);
      result.diagnostics.push_back(MakeDiagnostic(
          DiagnosticSeverity::WARNING, CalibrationStatus::DATA_INSUFFICIENT, msg.str()));
      return result;
    }

    case State::INVALID:
    {
      // Lower bound reports the previous block, as GGIR-derived tooling does
      const double index = static_cast<double>(window_index);
      std::ostringstream msg;
      msg << "Calibration not done with " << m_config.min_hours + (index - 1.0) * kExpansionHours
          << " - " << m_config.min_hours + index * kExpansionHours
          << " hours due to insufficient non-movement data available";

      CalibrationResult result =
          MakeUncalibratedResult(std::move(recording), CalibrationStatus::CALIBRATION_INVALID);
      result.attempts = std::move(attempts);
      result.diagnostics.push_back(MakeDiagnostic(
          DiagnosticSeverity::WARNING, CalibrationStatus::CALIBRATION_INVALID, msg.str()));
      return result;
    }

    default:
      break;
  }

  CalibrationResult result;
  result.status = CalibrationStatus::CALIBRATED;
  result.scale = final_fit.scale;
  result.offset = final_fit.offset;
  result.cal_error_start = final_fit.cal_error_start;
  result.cal_error_end = final_fit.cal_error_end;
  result.sampling_rate_hz = fs;

  // Fit used a prefix, the transform covers the whole recording
  result.cal_acceleration = std::move(recording.acceleration);
  AffineTransform(final_fit.scale, final_fit.offset).ApplyInPlace(result.cal_acceleration);

  result.time_s = std::move(recording.time_s);
  result.auxiliary = std::move(recording.auxiliary);

  std::ostringstream msg;
  msg << "Calibration accepted using " << attempts.back().window_hours
      << " hours of data, error " << final_fit.cal_error_start << " -> "
      << final_fit.cal_error_end << " g";
  result.attempts = std::move(attempts);
  result.diagnostics.push_back(
      MakeDiagnostic(DiagnosticSeverity::INFO, CalibrationStatus::CALIBRATED, msg.str()));

  return result;
}

CalibrationResult SphereCalibrator::MakeUncalibratedResult(RecordingData&& recording,
                                                           CalibrationStatus status)
{
  CalibrationResult result;
  result.status = status;
  result.cal_acceleration = std::move(recording.acceleration);
  result.scale = {0.0, 0.0, 0.0};
  result.offset = {0.0, 0.0, 0.0};
  result.sampling_rate_hz = recording.sampling_rate_hz;
  result.cal_error_start = 0.0;
  result.cal_error_end = 0.0;
  result.time_s = std::move(recording.time_s);
  result.auxiliary = std::move(recording.auxiliary);
  return result;
}
} // namespace GRAVCAL::CALIBRATION
