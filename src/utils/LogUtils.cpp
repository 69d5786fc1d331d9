/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "LogUtils.h"

#include <rclcpp/logging.hpp>
#include <rclcpp/node.hpp>
#include <rcutils/error_handling.h>
#include <rcutils/logging.h>

using namespace GRAVCAL;
using namespace UTILS;

rclcpp::Logger LogUtils::InitializeLogging(const std::shared_ptr<rclcpp::Node>& node, bool debug)
{
  rclcpp::Logger logger = node->get_logger();

  const int severity = debug ? RCUTILS_LOG_SEVERITY_DEBUG : RCUTILS_LOG_SEVERITY_INFO;

  RCLCPP_INFO(logger, "Setting log severity threshold to %s", debug ? "DEBUG" : "INFO");

  auto ret = rcutils_logging_set_logger_level(logger.get_name(), severity);
  if (ret != RCUTILS_RET_OK)
  {
    RCLCPP_ERROR(logger, "Error setting severity: %s", rcutils_get_error_string().str);
    rcutils_reset_error();
  }

  return logger;
}
