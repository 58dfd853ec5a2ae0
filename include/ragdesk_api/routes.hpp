#pragma once
#include <memory>
#include <nlohmann/json.hpp>

#include "ragdesk_core/errors.hpp"
#include "server.hpp"

// Forward declarations
namespace ragdesk_core {
class ServiceProvider;
}  // namespace ragdesk_core

namespace ragdesk_api {

// InvalidInput 400, Timeout 504, Upstream 502, everything else 500
int http_status_for(ragdesk_core::ErrorKind kind);

class Routes {
 public:
  explicit Routes(std::shared_ptr<ragdesk_core::ServiceProvider> services);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Route handlers, callable directly in tests
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_answer(const crow::request &req);
  crow::response handle_search(const crow::request &req);

 private:
  std::shared_ptr<ragdesk_core::ServiceProvider> services_;

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  crow::response create_error_response(const std::string &error, const std::string &kind,
                                       int status_code);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace ragdesk_api
