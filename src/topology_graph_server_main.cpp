#include <rclcpp/rclcpp.hpp>

#include <memory>

#include "topomap/topology_graph_server_node.hpp"

int main(int argc, char *argv[]) {
  rclcpp::init(argc, argv);
  auto node = std::make_shared<topomap::TopologyGraphServerNode>();

  // A request still waiting for the first map would keep the executor from joining
  std::weak_ptr<topomap::TopologyGraphServerNode> weak_node = node;
  rclcpp::on_shutdown([weak_node]() {
    if (auto n = weak_node.lock()) {
      n->service().shutdown();
    }
  });

  // Graph requests block until a map arrives; map delivery needs its own thread
  rclcpp::executors::MultiThreadedExecutor executor;
  executor.add_node(node);
  executor.spin();

  rclcpp::shutdown();
  return 0;
}
