/*
 *  Copyright (C) 2026 Garrett Brown
 *  This file is part of GRAVCAL
 *
 *  SPDX-License-Identifier: Apache-2.0
 *  See the file LICENSE.txt for more information.
 */

#include "nodes/CalibrationNode.h"

#include <memory>

#include <rclcpp/rclcpp.hpp>

int main(int argc, char* argv[])
{
  rclcpp::init(argc, argv);

  std::shared_ptr<GRAVCAL::ROS::CalibrationNode> node =
      std::make_shared<GRAVCAL::ROS::CalibrationNode>();

  if (!node->Initialize())
  {
    rclcpp::shutdown();
    return -1;
  }

  const bool success = node->Run();

  node->Deinitialize();

  rclcpp::shutdown();

  return success ? 0 : 1;
}
