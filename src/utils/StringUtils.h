/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <string>
#include <vector>

namespace GRAVCAL
{
namespace UTILS
{

class StringUtils
{
public:
  /*!
   * \dev Strip leading and trailing whitespace, including a trailing '\r'
   *
   * \param str The string to trim
   *
   * \return The trimmed copy
   */
  static std::string Trim(const std::string& str);

  /*!
   * \dev Split a string on a delimiter
   *
   * Empty fields are kept, so "a,,b" yields three fields.
   *
   * \param str The string to split
   * \param delimiter The field separator
   *
   * \return The fields, each trimmed
   */
  static std::vector<std::string> Split(const std::string& str, char delimiter);

  /*!
   * \dev Parse a complete string as a double
   *
   * \param str The string to parse
   * \param value Set to the parsed value on success
   *
   * \return True if the whole string was a valid number
   */
  static bool ParseDouble(const std::string& str, double& value);
};

} // namespace UTILS
} // namespace GRAVCAL
