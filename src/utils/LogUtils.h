/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#pragma once

#include <memory>

#include <rclcpp/logger.hpp>

namespace rclcpp
{
class Node;
}

namespace GRAVCAL
{
namespace UTILS
{

class LogUtils
{
public:
  /*!
   * \dev Set the node's logger threshold
   *
   * \param node The node owning the logger
   * \param debug True to log at DEBUG, false to log at INFO
   *
   * \return The node's logger
   */
  static rclcpp::Logger InitializeLogging(const std::shared_ptr<rclcpp::Node>& node, bool debug);
};

} // namespace UTILS
} // namespace GRAVCAL
