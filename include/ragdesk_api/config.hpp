#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

class Config {
 public:
  std::string api_base_url;
  std::string documents_dir;

  // Embedding provider: "openai" or "ollama"
  std::string embedding_provider;
  std::string embedding_url;
  std::string ollama_url;
  std::string embedding_model;
  // Name of the environment variable holding the API key, never the key itself
  std::string api_key_env;
  int embedding_batch_size;
  int request_timeout_seconds;

  // Web search provider: "simulated" or "tavily"
  std::string web_search_provider;
  std::string web_search_url;
  // Name of the environment variable holding the Tavily API key
  std::string web_search_api_key_env;

  // Chunking and retrieval
  int chunk_size;
  int chunk_overlap;
  int default_top_k;
  // "skip_failed" or "fail_fast"
  std::string load_policy;

  // Empty keeps cost records in memory only
  std::string cost_log_path;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    Config config;

    // Apply defaults when keys are missing
    config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));
    config.documents_dir = json_config.value("documents_dir", std::string("./data"));
    config.embedding_provider = json_config.value("embedding_provider", std::string("openai"));
    config.embedding_url =
        json_config.value("embedding_url", std::string("https://api.openai.com/v1/embeddings"));
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model =
        json_config.value("embedding_model", std::string("text-embedding-3-small"));
    config.api_key_env = json_config.value("api_key_env", std::string("OPENAI_API_KEY"));
    config.web_search_provider =
        json_config.value("web_search_provider", std::string("simulated"));
    config.web_search_url =
        json_config.value("web_search_url", std::string("https://api.tavily.com/search"));
    config.web_search_api_key_env =
        json_config.value("web_search_api_key_env", std::string("TAVILY_API_KEY"));
    config.load_policy = json_config.value("load_policy", std::string("skip_failed"));
    config.cost_log_path =
        json_config.value("cost_log_path", std::string("./data/ragdesk_costs.json"));

    config.embedding_batch_size = int_or_default(json_config, "embedding_batch_size", 512);
    config.request_timeout_seconds = int_or_default(json_config, "request_timeout_seconds", 60);
    config.chunk_size = int_or_default(json_config, "chunk_size", 1000);
    config.chunk_overlap = int_or_default(json_config, "chunk_overlap", 200);
    config.default_top_k = int_or_default(json_config, "default_top_k", 3);

    config.validate();
    return config;
  }

 private:
  // Integers fall back to the default when missing; a wrong type is an error
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(std::string(key) + " must be an integer");
    }
    return value.get<int>();
  }

  void validate() const {
    if (api_base_url.empty() || api_base_url.find(':') == std::string::npos) {
      throw std::runtime_error("api_base_url must be of the form host:port");
    }
    if (documents_dir.empty()) {
      throw std::runtime_error("documents_dir cannot be empty");
    }
    if (embedding_provider != "openai" && embedding_provider != "ollama") {
      throw std::runtime_error("embedding_provider must be 'openai' or 'ollama', got '" +
                               embedding_provider + "'");
    }
    if (embedding_provider == "openai" && embedding_url.empty()) {
      throw std::runtime_error("embedding_url cannot be empty");
    }
    if (embedding_provider == "openai" && api_key_env.empty()) {
      throw std::runtime_error("api_key_env cannot be empty");
    }
    if (embedding_provider == "ollama" && ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (web_search_provider != "simulated" && web_search_provider != "tavily") {
      throw std::runtime_error("web_search_provider must be 'simulated' or 'tavily', got '" +
                               web_search_provider + "'");
    }
    if (web_search_provider == "tavily" &&
        (web_search_url.empty() || web_search_api_key_env.empty())) {
      throw std::runtime_error("web_search_url and web_search_api_key_env cannot be empty");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (request_timeout_seconds <= 0) {
      throw std::runtime_error("request_timeout_seconds must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_size) {
      throw std::runtime_error("chunk_overlap must be at least 0 and less than chunk_size");
    }
    if (default_top_k <= 0) {
      throw std::runtime_error("default_top_k must be greater than 0");
    }
    if (load_policy != "skip_failed" && load_policy != "fail_fast") {
      throw std::runtime_error("load_policy must be 'skip_failed' or 'fail_fast', got '" +
                               load_policy + "'");
    }
  }
};
