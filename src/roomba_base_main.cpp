#include "roomba_base/roomba_base_node.hpp"
#include <rclcpp/rclcpp.hpp>

int main(int argc, char** argv) {
  rclcpp::init(argc, argv);

  auto registry = std::make_shared<roomba_base::ConnectionRegistry>();
  {
    auto node = std::make_shared<roomba_base::RoombaBaseNode>(registry);
    rclcpp::spin(node);
  }
  registry->shutdown();

  rclcpp::shutdown();
  return 0;
}
