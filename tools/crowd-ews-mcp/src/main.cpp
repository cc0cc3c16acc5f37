#include <iostream>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/engine.hpp"
#include "mcp/server.hpp"
#include "mcp/tools.hpp"

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "configs/engine.default.yaml";

  std::shared_ptr<crowd_ews::core::Engine> engine;
  try {
    engine = std::make_shared<crowd_ews::core::Engine>(crowd_ews::core::load_engine_config(config_path));
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  crowd_ews::mcp::Server server(crowd_ews::mcp::build_tool_registry(engine),
                                crowd_ews::mcp::build_resource_registry(engine));
  return server.run(std::cin, std::cout, std::cerr);
}
