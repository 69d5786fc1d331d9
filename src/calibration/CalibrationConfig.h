/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <cstddef>

namespace GRAVCAL::CALIBRATION
{
/*!
 * \brief Parameters that control sphere calibration
 *
 * Defaults follow GGIR and suit GENEActiv-class devices.
 */
struct CalibrationConfig
{
  /*!
   * \brief Minimum still-sample reach on both sides of 0 g, per axis
   *
   * Units: g
   */
  double sphere_crit{0.3};

  /*!
   * \brief Amount of data used by the first fit attempt
   *
   * Units: hours
   */
  double min_hours{72.0};

  /*!
   * \brief Window standard deviation below which an axis is still
   *
   * Units: g. About 1.2x the bench-top noise of the device.
   */
  double sd_crit{0.013};

  /*!
   * \brief Maximum closest-point iterations per fit
   */
  std::size_t max_iter{1000};

  /*!
   * \brief Residual change that ends the iteration
   */
  double tol{1e-10};
};
} // namespace GRAVCAL::CALIBRATION
