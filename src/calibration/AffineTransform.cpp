/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "calibration/AffineTransform.h"

namespace GRAVCAL::CALIBRATION
{
AffineTransform::AffineTransform(const Vec3& scale, const Vec3& offset)
  : m_scale(scale), m_offset(offset)
{
}

Vec3 AffineTransform::Apply(const Vec3& sample) const
{
  return {sample[0] * m_scale[0] + m_offset[0], sample[1] * m_scale[1] + m_offset[1],
          sample[2] * m_scale[2] + m_offset[2]};
}

Vec3 AffineTransform::ApplyInverse(const Vec3& sample) const
{
  return {(sample[0] - m_offset[0]) / m_scale[0], (sample[1] - m_offset[1]) / m_scale[1],
          (sample[2] - m_offset[2]) / m_scale[2]};
}

AccelTable AffineTransform::Apply(const AccelTable& table) const
{
  AccelTable out;
  out.reserve(table.size());

  for (const Vec3& sample : table)
    out.push_back(Apply(sample));

  return out;
}

AccelTable AffineTransform::ApplyInverse(const AccelTable& table) const
{
  AccelTable out;
  out.reserve(table.size());

  for (const Vec3& sample : table)
    out.push_back(ApplyInverse(sample));

  return out;
}

void AffineTransform::ApplyInPlace(AccelTable& table) const
{
  for (Vec3& sample : table)
    sample = Apply(sample);
}
} // namespace GRAVCAL::CALIBRATION
