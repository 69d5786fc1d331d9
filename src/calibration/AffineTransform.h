/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include "calibration/CalibrationTypes.h"

namespace GRAVCAL::CALIBRATION
{
/*!
 * \brief Per-axis affine correction of acceleration tables
 *
 * Forward model:
 *   out[k] = in[k] * scale[k] + offset[k]
 *
 * Inverse model:
 *   in[k] = (out[k] - offset[k]) / scale[k]
 *
 * Applying the forward model twice is not the same as applying it once.
 */
class AffineTransform
{
public:
  AffineTransform(const Vec3& scale, const Vec3& offset);

  const Vec3& Scale() const { return m_scale; }
  const Vec3& Offset() const { return m_offset; }

  Vec3 Apply(const Vec3& sample) const;
  Vec3 ApplyInverse(const Vec3& sample) const;

  AccelTable Apply(const AccelTable& table) const;
  AccelTable ApplyInverse(const AccelTable& table) const;

  // Transform in place, used on large recordings to avoid a second copy
  void ApplyInPlace(AccelTable& table) const;

private:
  Vec3 m_scale;
  Vec3 m_offset;
};
} // namespace GRAVCAL::CALIBRATION
