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
#include "stats/IWindowStatistics.h"

#include <cstddef>
#include <memory>

namespace GRAVCAL::CALIBRATION
{
/*!
 * \brief Autocalibration of a full accelerometer recording
 *
 * Fits the leading min_hours of data first. When that fit is not accepted
 * the window grows by 12 hour blocks until a fit is accepted or the whole
 * recording has been tried. An accepted calibration is applied once to the
 * entire recording.
 *
 * Calibrate() is stateless between calls. The object only holds its
 * configuration and the window statistics provider.
 */
class SphereCalibrator
{
public:
  /*!
   * \brief Size of one window expansion block
   *
   * Units: hours
   */
  static constexpr double kExpansionHours = 12.0;

  enum class State
  {
    INSUFFICIENT,
    FITTING,
    ACCEPTED,
    INVALID
  };

  SphereCalibrator();
  explicit SphereCalibrator(const CalibrationConfig& config);
  SphereCalibrator(const CalibrationConfig& config,
                   std::unique_ptr<STATS::IWindowStatistics> statistics);

  const CalibrationConfig& GetConfig() const { return m_config; }

  /*!
   * \brief Calibrate a recording
   *
   * The recording is taken by value so callers can move large tables in.
   * Throws std::invalid_argument on malformed input.
   */
  CalibrationResult Calibrate(RecordingData recording) const;

  /*!
   * \brief Reject malformed recordings and configurations
   *
   * \throws std::invalid_argument with a description of the first problem
   */
  void Validate(const RecordingData& recording) const;

  /*!
   * \brief Number of samples in the first fit window
   */
  static std::size_t MinimumSamples(double min_hours, double sampling_rate_hz);

  /*!
   * \brief Number of samples added per window expansion
   */
  static std::size_t ExpansionSamples(double sampling_rate_hz);

private:
  static CalibrationResult MakeUncalibratedResult(RecordingData&& recording,
                                                  CalibrationStatus status);

  CalibrationConfig m_config;
  std::unique_ptr<STATS::IWindowStatistics> m_statistics;
};
} // namespace GRAVCAL::CALIBRATION
