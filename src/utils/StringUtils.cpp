/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "StringUtils.h"

#include <cerrno>
#include <cstdlib>

using namespace GRAVCAL;
using namespace UTILS;

namespace
{
constexpr const char* WHITESPACE = " \t\r\n";
} // namespace

std::string StringUtils::Trim(const std::string& str)
{
  const std::size_t begin = str.find_first_not_of(WHITESPACE);
  if (begin == std::string::npos)
    return "";

  const std::size_t end = str.find_last_not_of(WHITESPACE);

  return str.substr(begin, end - begin + 1);
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter)
{
  std::vector<std::string> fields;

  std::size_t start = 0;
  while (true)
  {
    const std::size_t pos = str.find(delimiter, start);
    if (pos == std::string::npos)
    {
      fields.push_back(Trim(str.substr(start)));
      break;
    }

    fields.push_back(Trim(str.substr(start, pos - start)));
    start = pos + 1;
  }

  return fields;
}

bool StringUtils::ParseDouble(const std::string& str, double& value)
{
  if (str.empty())
    return false;

  const char* begin = str.c_str();
  char* end = nullptr;

  errno = 0;
  const double parsed = std::strtod(begin, &end);

  if (end == begin || *end != '\0' || errno == ERANGE)
    return false;

  value = parsed;
  return true;
}
