/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace GRAVCAL
{
using Vec3 = std::array<double, 3>;

/*!
 * \brief Triaxial acceleration samples, one (x, y, z) row per sample
 *
 * Units: g
 */
using AccelTable = std::vector<Vec3>;

/*!
 * \brief Sample timestamps, one per acceleration row
 *
 * Units: seconds, monotonically non-decreasing
 */
using TimeSequence = std::vector<double>;

/*!
 * \brief Single-channel auxiliary sensor series
 */
struct ScalarSeries
{
  /*!
   * \brief Sample timestamps
   *
   * Units: seconds
   */
  std::vector<double> time_s;

  /*!
   * \brief Sample values in the sensor's native units
   */
  std::vector<double> values;
};

/*!
 * \brief Co-located sensor tables that travel with a recording
 *
 * Calibration never reads or modifies these, they are forwarded unchanged.
 */
struct AuxiliarySensors
{
  std::optional<ScalarSeries> lux;
  std::optional<ScalarSeries> lux_mean;
  std::optional<ScalarSeries> battery;
  std::optional<ScalarSeries> battery_upsampled;
  std::optional<ScalarSeries> capsense;
  std::optional<ScalarSeries> capsense_upsampled;
};

/*!
 * \brief One raw recording to be calibrated
 */
struct RecordingData
{
  AccelTable acceleration;
  TimeSequence time_s;

  /*!
   * \brief Fixed sampling rate of the acceleration table
   *
   * Units: Hz
   */
  double sampling_rate_hz{0.0};

  AuxiliarySensors auxiliary;
};

namespace CALIBRATION
{
/*!
 * \brief Outcome of a single closest-point fit
 */
enum class FitOutcome
{
  // Error improved and fell below the acceptance threshold
  ACCEPTED,

  // Still samples do not span both sides of every axis
  SPHERE_UNDERPOPULATED,

  // Iteration finished but the acceptance rule failed
  ERROR_NOT_IMPROVED,
};

/*!
 * \brief Overall status of a calibration run
 */
enum class CalibrationStatus
{
  CALIBRATED,
  DATA_INSUFFICIENT,
  CALIBRATION_INVALID,
};

enum class DiagnosticSeverity
{
  INFO,
  WARNING,
};

/*!
 * \brief Advisory emitted by a calibration run
 *
 * Advisories are informational, a run that produces one still returns a
 * usable result.
 */
struct CalibrationDiagnostic
{
  DiagnosticSeverity severity{DiagnosticSeverity::WARNING};
  CalibrationStatus code{CalibrationStatus::CALIBRATED};
  std::string message;
};

/*!
 * \brief Record of one orchestrator round
 */
struct FitAttempt
{
  // Units: samples
  std::size_t window_samples{0};

  // Units: hours
  double window_hours{0.0};

  FitOutcome outcome{FitOutcome::SPHERE_UNDERPOPULATED};

  // Units: g
  double cal_error_start{0.0};
  double cal_error_end{0.0};
};

/*!
 * \brief Result of calibrating one recording
 *
 * Model: a_cal = a_raw * scale + offset (per axis)
 */
struct CalibrationResult
{
  /*!
   * \brief Calibrated acceleration, or the raw table when not calibrated
   *
   * Units: g
   */
  AccelTable cal_acceleration;

  /*!
   * \brief Per-axis scale, zero when not calibrated
   */
  Vec3 scale{0.0, 0.0, 0.0};

  /*!
   * \brief Per-axis offset, zero when not calibrated
   *
   * Units: g
   */
  Vec3 offset{0.0, 0.0, 0.0};

  // Units: Hz
  double sampling_rate_hz{0.0};

  /*!
   * \brief Mean absolute deviation of still-period norms from 1 g
   *
   * Units: g
   */
  double cal_error_start{0.0};
  double cal_error_end{0.0};

  // Full-length timestamps of the original recording
  TimeSequence time_s;

  AuxiliarySensors auxiliary;

  CalibrationStatus status{CalibrationStatus::DATA_INSUFFICIENT};

  std::vector<FitAttempt> attempts;

  std::vector<CalibrationDiagnostic> diagnostics;
};

const char* ToString(FitOutcome outcome);
const char* ToString(CalibrationStatus status);
const char* ToString(DiagnosticSeverity severity);
} // namespace CALIBRATION
} // namespace GRAVCAL
