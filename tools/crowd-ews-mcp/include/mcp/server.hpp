#pragma once

#include <iosfwd>

#include "mcp/tools.hpp"

namespace crowd_ews::mcp {

class Server {
 public:
  Server(ToolRegistry tools, ResourceRegistry resources);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  // should_respond is cleared for notifications; their result is discarded.
  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;

 private:
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_tools_list() const;
  nlohmann::json handle_tools_call(const nlohmann::json& params) const;
  nlohmann::json handle_resources_list() const;
  nlohmann::json handle_resources_read(const nlohmann::json& params) const;

  ToolRegistry tools_;
  ResourceRegistry resources_;
};

}  // namespace crowd_ews::mcp
