#pragma once
#include <filesystem>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>

#include "server.hpp"

// Forward declarations
namespace ragdesk_core {
class RetrievalService;
class ToolRegistry;
class ResponseGuardrails;
class QueryRouter;
class CostTracker;
}  // namespace ragdesk_core

namespace ragdesk_api {

class Routes {
 public:
  Routes(std::shared_ptr<ragdesk_core::RetrievalService> retrieval_service,
         std::shared_ptr<ragdesk_core::ToolRegistry> tool_registry,
         std::shared_ptr<ragdesk_core::ResponseGuardrails> guardrails,
         std::shared_ptr<ragdesk_core::QueryRouter> query_router,
         std::shared_ptr<ragdesk_core::CostTracker> cost_tracker,
         std::filesystem::path documents_dir);
  ~Routes() = default;

  // Holds the mutex that serializes calls into the retrieval service
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;
  Routes(Routes &&) = delete;
  Routes &operator=(Routes &&) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

  // Every .txt and .pdf directly inside the directory, sorted by name
  static std::vector<std::filesystem::path> discover_documents(
      const std::filesystem::path &directory);

 private:
  std::shared_ptr<ragdesk_core::RetrievalService> retrieval_service_;
  std::shared_ptr<ragdesk_core::ToolRegistry> tool_registry_;
  std::shared_ptr<ragdesk_core::ResponseGuardrails> guardrails_;
  std::shared_ptr<ragdesk_core::QueryRouter> query_router_;
  std::shared_ptr<ragdesk_core::CostTracker> cost_tracker_;
  std::filesystem::path documents_dir_;
  std::mutex service_mutex_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_list_tools(const crow::request &req);
  crow::response handle_invoke_tool(const crow::request &req, const std::string &name);
  crow::response handle_load_documents(const crow::request &req);
  crow::response handle_search(const crow::request &req);
  crow::response handle_check_answer(const crow::request &req);
  crow::response handle_route(const crow::request &req);
  crow::response handle_costs(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  std::string require_string(const nlohmann::json &body, const char *key);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
  // Maps the error kinds of the core library to HTTP status codes
  crow::response error_response_for(const std::exception &e, const char *handler);
};

}  // namespace ragdesk_api
