/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "calibration/CalibrationTypes.h"

namespace GRAVCAL::CALIBRATION
{
const char* ToString(FitOutcome outcome)
{
  switch (outcome)
  {
    case FitOutcome::ACCEPTED:
      return "accepted";
    case FitOutcome::SPHERE_UNDERPOPULATED:
      return "sphere_underpopulated";
    case FitOutcome::ERROR_NOT_IMPROVED:
      return "error_not_improved";
    default:
      break;
  }

  return "unknown";
}

const char* ToString(CalibrationStatus status)
{
  switch (status)
  {
    case CalibrationStatus::CALIBRATED:
      return "calibrated";
    case CalibrationStatus::DATA_INSUFFICIENT:
      return "data_insufficient";
    case CalibrationStatus::CALIBRATION_INVALID:
      return "calibration_invalid";
    default:
      break;
  }

  return "unknown";
}

const char* ToString(DiagnosticSeverity severity)
{
  switch (severity)
  {
    case DiagnosticSeverity::INFO:
      return "info";
    case DiagnosticSeverity::WARNING:
      return "warning";
    default:
      break;
  }

  return "unknown";
}
} // namespace GRAVCAL::CALIBRATION
