#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "ragdesk_api/config.hpp"
#include "ragdesk_api/routes.hpp"
#include "ragdesk_api/server.hpp"
#include "ragdesk_core/cost/cost_tracker.hpp"
#include "ragdesk_core/extractors/content_extractor_factory.hpp"
#include "ragdesk_core/guardrails/response_guardrails.hpp"
#include "ragdesk_core/llm/http_transport.hpp"
#include "ragdesk_core/llm/ollama_client.hpp"
#include "ragdesk_core/llm/openai_embedding_client.hpp"
#include "ragdesk_core/routing/query_router.hpp"
#include "ragdesk_core/services/retrieval_service.hpp"
#include "ragdesk_core/tools/tool_registry.hpp"
#include "ragdesk_core/tools/web_search_tool.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

namespace {

std::shared_ptr<ragdesk_core::EmbeddingClient> make_embedding_client(
    const Config &config, std::shared_ptr<ragdesk_core::CostTracker> cost_tracker) {
  if (config.embedding_provider == "ollama") {
    return std::make_shared<ragdesk_core::OllamaClient>(config.ollama_url, config.embedding_model,
                                                        cost_tracker);
  }

  const char *api_key = std::getenv(config.api_key_env.c_str());
  if (api_key == nullptr || *api_key == '\0') {
    // Not fatal: tools and routing still work, embedding calls report the missing key
    std::cerr << "Warning: " << config.api_key_env
              << " is not set. Document loading and search will fail until it is." << std::endl;
  }

  ragdesk_core::OpenAIEmbeddingOptions options;
  options.url = config.embedding_url;
  options.model = config.embedding_model;
  options.api_key = api_key != nullptr ? api_key : "";
  options.batch_size = static_cast<size_t>(config.embedding_batch_size);
  auto transport =
      std::make_shared<ragdesk_core::CurlHttpTransport>(config.request_timeout_seconds);
  return std::make_shared<ragdesk_core::OpenAIEmbeddingClient>(options, transport, cost_tracker);
}

ragdesk_core::WebSearchTool make_web_search_tool(const Config &config) {
  if (config.web_search_provider != "tavily") {
    return ragdesk_core::WebSearchTool{};
  }

  ragdesk_core::WebSearchOptions options;
  options.mode = ragdesk_core::WebSearchMode::Tavily;
  options.url = config.web_search_url;
  const char *api_key = std::getenv(config.web_search_api_key_env.c_str());
  options.api_key = api_key != nullptr ? api_key : "";
  auto transport =
      std::make_shared<ragdesk_core::CurlHttpTransport>(config.request_timeout_seconds);
  return ragdesk_core::WebSearchTool(options, transport);
}

}  // namespace

int main() {
  try {
    const char *config_override = std::getenv("RAGDESK_CONFIG");
    std::string config_path = config_override != nullptr ? config_override : "ragdeskrc.json";
    Config config = Config::from_file(config_path);

    std::cout << "Starting RAGDesk API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Documents Directory: " << config.documents_dir << std::endl;
    std::cout << "Embedding Provider: " << config.embedding_provider << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Chunk Size / Overlap: " << config.chunk_size << " / " << config.chunk_overlap
              << std::endl;

    // Initialize core components
    std::filesystem::path cost_log_path = config.cost_log_path;
    if (!cost_log_path.empty() && cost_log_path.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(cost_log_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Warning: Failed to create cost log directory: " << ec.message() << std::endl;
      }
    }
    auto cost_tracker = std::make_shared<ragdesk_core::CostTracker>(cost_log_path);
    auto embedding_client = make_embedding_client(config, cost_tracker);
    auto content_extractor_factory = std::make_shared<ragdesk_core::ContentExtractorFactory>();

    ragdesk_core::RetrievalOptions retrieval_options;
    retrieval_options.chunking.max_size = static_cast<size_t>(config.chunk_size);
    retrieval_options.chunking.overlap = static_cast<size_t>(config.chunk_overlap);
    retrieval_options.default_top_k = static_cast<size_t>(config.default_top_k);
    retrieval_options.load_policy = config.load_policy == "fail_fast"
                                        ? ragdesk_core::LoadPolicy::FailFast
                                        : ragdesk_core::LoadPolicy::SkipFailed;
    auto retrieval_service = std::make_shared<ragdesk_core::RetrievalService>(
        embedding_client, content_extractor_factory, retrieval_options);

    auto tool_registry = std::make_shared<ragdesk_core::ToolRegistry>();
    tool_registry->register_tool(retrieval_service->as_tool());
    auto web_search_tool = make_web_search_tool(config);
    std::cout << "Web Search: "
              << (web_search_tool.mode() == ragdesk_core::WebSearchMode::Tavily ? "tavily"
                                                                               : "simulated")
              << std::endl;
    tool_registry->register_tool(web_search_tool.as_tool());

    auto guardrails = std::make_shared<ragdesk_core::ResponseGuardrails>();
    auto query_router = std::make_shared<ragdesk_core::QueryRouter>();

    // Initial corpus from the documents directory
    auto initial_documents = ragdesk_api::Routes::discover_documents(config.documents_dir);
    if (!initial_documents.empty()) {
      std::cout << "Loading " << initial_documents.size() << " document(s) from "
                << config.documents_dir << "..." << std::endl;
      try {
        retrieval_service->load_documents(initial_documents);
      } catch (const std::exception &e) {
        std::cerr << "Warning: Initial document load failed: " << e.what() << std::endl;
      }
    }

    std::string host = config.api_base_url.substr(0, config.api_base_url.find(':'));
    int port = std::stoi(config.api_base_url.substr(config.api_base_url.find(':') + 1));
    ragdesk_api::Server server(host, port);
    ragdesk_api::Routes routes(retrieval_service, tool_registry, guardrails, query_router,
                               cost_tracker, config.documents_dir);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Session cost summary:" << std::endl;
    cost_tracker->print_session_summary(std::cout);
    cost_tracker->print_project_summary(std::cout, "RAGDesk");

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
