#include "ragdesk_api/routes.hpp"

#include <algorithm>
#include <iostream>
#include <nlohmann/json.hpp>

#include "ragdesk_core/cost/cost_tracker.hpp"
#include "ragdesk_core/guardrails/response_guardrails.hpp"
#include "ragdesk_core/llm/embedding_client.hpp"
#include "ragdesk_core/routing/query_router.hpp"
#include "ragdesk_core/services/retrieval_service.hpp"
#include "ragdesk_core/text/text_utils.hpp"
#include "ragdesk_core/tools/tool_registry.hpp"
#include "ragdesk_core/tools/web_search_tool.hpp"

namespace ragdesk_api {

namespace {

// Malformed request bodies
class BadRequestError : public std::exception {
 public:
  explicit BadRequestError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

}  // namespace

Routes::Routes(std::shared_ptr<ragdesk_core::RetrievalService> retrieval_service,
               std::shared_ptr<ragdesk_core::ToolRegistry> tool_registry,
               std::shared_ptr<ragdesk_core::ResponseGuardrails> guardrails,
               std::shared_ptr<ragdesk_core::QueryRouter> query_router,
               std::shared_ptr<ragdesk_core::CostTracker> cost_tracker,
               std::filesystem::path documents_dir)
    : retrieval_service_(retrieval_service),
      tool_registry_(tool_registry),
      guardrails_(guardrails),
      query_router_(query_router),
      cost_tracker_(cost_tracker),
      documents_dir_(std::move(documents_dir)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  // Health check endpoint
  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  // Tool discovery and invocation
  CROW_ROUTE(app, "/tools")
  ([this](const crow::request &req) { return handle_list_tools(req); });

  CROW_ROUTE(app, "/tools/<string>")
      .methods(crow::HTTPMethod::POST)([this](const crow::request &req, const std::string &name) {
        return handle_invoke_tool(req, name);
      });

  CROW_ROUTE(app, "/documents/load")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_load_documents(req); });

  CROW_ROUTE(app, "/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/guardrails/check")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_check_answer(req); });

  CROW_ROUTE(app, "/route").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_route(req);
  });

  CROW_ROUTE(app, "/costs")
  ([this](const crow::request &req) { return handle_costs(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

std::vector<std::filesystem::path> Routes::discover_documents(
    const std::filesystem::path &directory) {
  std::vector<std::filesystem::path> paths;
  std::error_code ec;
  if (!std::filesystem::is_directory(directory, ec)) {
    return paths;
  }
  for (const auto &entry : std::filesystem::directory_iterator(directory)) {
    if (!entry.is_regular_file()) {
      continue;
    }
    std::string ext = ragdesk_core::text::to_lower(entry.path().extension().string());
    if (ext == ".txt" || ext == ".pdf") {
      paths.push_back(entry.path());
    }
  }
  std::sort(paths.begin(), paths.end());
  return paths;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  nlohmann::json response = create_success_response("RAGDesk API is running");
  response["version"] = "0.1.0";
  response["status"] = "healthy";
  {
    std::lock_guard<std::mutex> lock(service_mutex_);
    response["chunks_loaded"] = retrieval_service_->chunk_count();
  }
  return create_json_response(response);
}

crow::response Routes::handle_list_tools(const crow::request &req) {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto &tool : tool_registry_->list()) {
    nlohmann::json tool_json;
    tool_json["name"] = tool.name;
    tool_json["description"] = tool.description;
    tool_json["parameters"] = {
        {"type", "object"},
        {"properties", {{"query", {{"type", "string"}, {"description", "Search query"}}}}},
        {"required", {"query"}}};
    tools.push_back(tool_json);
  }
  return create_json_response(create_success_response("Tools listed successfully", tools));
}

crow::response Routes::handle_invoke_tool(const crow::request &req, const std::string &name) {
  try {
    if (tool_registry_->find(name) == nullptr) {
      return create_json_response(create_error_response("Unknown tool: " + name), 404);
    }
    auto body = parse_json_body(req.body);
    std::string query = require_string(body, "query");
    std::cout << "Invoking tool " << name << " with query: " << query << std::endl;

    std::string result;
    {
      std::lock_guard<std::mutex> lock(service_mutex_);
      result = tool_registry_->invoke(name, query);
    }
    nlohmann::json response;
    response["result"] = result;
    return create_json_response(response);
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_invoke_tool");
  }
}

crow::response Routes::handle_load_documents(const crow::request &req) {
  try {
    std::vector<std::filesystem::path> paths;
    nlohmann::json body = req.body.empty() ? nlohmann::json::object() : parse_json_body(req.body);
    if (body.contains("file_paths")) {
      if (!body["file_paths"].is_array()) {
        throw BadRequestError("file_paths must be an array of strings");
      }
      for (const auto &path : body["file_paths"]) {
        if (!path.is_string()) {
          throw BadRequestError("file_paths must be an array of strings");
        }
        paths.emplace_back(path.get<std::string>());
      }
    } else {
      paths = discover_documents(documents_dir_);
    }

    std::cout << "Loading " << paths.size() << " document(s)" << std::endl;
    ragdesk_core::LoadReport report;
    size_t chunk_count = 0;
    {
      std::lock_guard<std::mutex> lock(service_mutex_);
      report = retrieval_service_->load_documents(paths);
      chunk_count = retrieval_service_->chunk_count();
    }

    nlohmann::json loaded = nlohmann::json::array();
    for (const auto &document : report.loaded) {
      loaded.push_back({{"source_name", document.source_name},
                        {"path", document.path.string()},
                        {"file_type", ragdesk_core::to_string(document.file_type)},
                        {"chunks", document.chunk_count}});
    }
    nlohmann::json failed = nlohmann::json::array();
    for (const auto &failure : report.failed) {
      failed.push_back({{"path", failure.path.string()}, {"reason", failure.reason}});
    }

    nlohmann::json data;
    data["loaded"] = loaded;
    data["failed"] = failed;
    data["total_chunks"] = chunk_count;
    std::string message = report.has_failures() ? "Documents loaded with failures"
                                                : "Documents loaded successfully";
    return create_json_response(create_success_response(message, data));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_load_documents");
  }
}

crow::response Routes::handle_search(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string query = require_string(body, "query");
    int top_k = body.value("top_k", static_cast<int>(retrieval_service_->options().default_top_k));
    if (top_k <= 0) {
      throw BadRequestError("top_k must be greater than 0");
    }

    std::cout << "Document search for: " << query << " with top_k: " << top_k << std::endl;

    std::vector<ragdesk_core::SearchResultEntry> entries;
    {
      std::lock_guard<std::mutex> lock(service_mutex_);
      entries = retrieval_service_->search_chunks(query, static_cast<size_t>(top_k));
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto &entry : entries) {
      nlohmann::json result_json;
      result_json["rank"] = entry.rank;
      result_json["source_name"] = entry.source_name;
      result_json["chunk_index"] = entry.chunk_index;
      result_json["excerpt"] = entry.excerpt;
      result_json["distance"] = entry.distance;
      results.push_back(result_json);
    }
    nlohmann::json data;
    data["results"] = results;
    data["formatted"] = ragdesk_core::RetrievalService::format_results(entries);
    std::cout << "Chunk results: " << results.size() << std::endl;
    return create_json_response(create_success_response("Search completed", data));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_search");
  }
}

crow::response Routes::handle_check_answer(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string answer = require_string(body, "answer");
    std::vector<std::string> tools_used;
    if (body.contains("tools_used")) {
      tools_used = body["tools_used"].get<std::vector<std::string>>();
    }

    auto verification = guardrails_->verify_sources(answer, tools_used);
    auto uncertainty = guardrails_->detect_uncertainty(answer);

    nlohmann::json data;
    data["has_sources"] = verification.has_sources;
    data["cited_tools"] = verification.cited_tools;
    data["confidence"] = verification.confidence;
    data["is_uncertain"] = uncertainty.is_uncertain;
    data["should_ask_clarification"] = uncertainty.should_ask_clarification;
    data["enhanced_answer"] = guardrails_->enhance_response(answer, tools_used);
    return create_json_response(create_success_response("Answer checked", data));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_check_answer");
  }
}

crow::response Routes::handle_route(const crow::request &req) {
  try {
    auto body = parse_json_body(req.body);
    std::string question = require_string(body, "question");

    auto decision = query_router_->classify(question);
    nlohmann::json data;
    data["route"] = ragdesk_core::to_string(decision.route);
    data["tools"] = ragdesk_core::QueryRouter::tools_for(decision.route);
    data["reasons"] = decision.reasons;
    return create_json_response(create_success_response("Question routed", data));
  } catch (const std::exception &e) {
    return error_response_for(e, "handle_route");
  }
}

crow::response Routes::handle_costs(const crow::request &req) {
  ragdesk_core::CostSummary summary;
  ragdesk_core::CostSummary project;
  {
    std::lock_guard<std::mutex> lock(service_mutex_);
    summary = cost_tracker_->session_summary();
    project = cost_tracker_->project_summary();
  }

  nlohmann::json by_model = nlohmann::json::object();
  for (const auto &[model, breakdown] : summary.by_model) {
    by_model[model] = {
        {"calls", breakdown.calls}, {"tokens", breakdown.tokens}, {"cost", breakdown.cost}};
  }
  nlohmann::json data;
  data["calls"] = summary.calls;
  data["total_tokens"] = summary.total_tokens;
  data["total_cost"] = summary.total_cost;
  data["project_calls"] = project.calls;
  data["project_total_tokens"] = project.total_tokens;
  data["project_total_cost"] = project.total_cost;
  data["by_model"] = by_model;
  return create_json_response(create_success_response("Session costs", data));
}

crow::response Routes::error_response_for(const std::exception &e, const char *handler) {
  std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
  int status = 400;
  if (dynamic_cast<const ragdesk_core::EmptyIndexError *>(&e) != nullptr) {
    status = 409;
  } else if (dynamic_cast<const ragdesk_core::AuthenticationError *>(&e) != nullptr) {
    status = 401;
  } else if (dynamic_cast<const ragdesk_core::ServiceUnavailableError *>(&e) != nullptr ||
             dynamic_cast<const ragdesk_core::WebSearchError *>(&e) != nullptr) {
    status = 503;
  } else if (dynamic_cast<const ragdesk_core::ToolNotFoundError *>(&e) != nullptr) {
    status = 404;
  }
  return create_json_response(create_error_response(e.what()), status);
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  try {
    return nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw BadRequestError(std::string("Invalid JSON body: ") + e.what());
  }
}

std::string Routes::require_string(const nlohmann::json &body, const char *key) {
  if (!body.contains(key) || !body[key].is_string() || body[key].get<std::string>().empty()) {
    throw BadRequestError(std::string("Missing required field: ") + key);
  }
  return body[key].get<std::string>();
}

}  // namespace ragdesk_api
