#include "ragdesk_core/llm/ollama_client.hpp"

#include <stdexcept>

#include "ollama.hpp"

namespace ragdesk_core {

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           std::shared_ptr<CostTracker> cost_tracker)
    : ollama_url_(ollama_url),
      embedding_model_(embedding_model),
      cost_tracker_(std::move(cost_tracker)) {
  if (!cost_tracker_) {
    throw std::invalid_argument("OllamaClient requires a cost tracker");
  }
  ollama::setServerURL(ollama_url_);
}

// The embed endpoint is called once per text; usage is recorded per call
std::vector<std::vector<float>> OllamaClient::get_embeddings(
    const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  if (!is_server_available()) {
    throw ServiceUnavailableError("Ollama server is not running at " + ollama_url_);
  }

  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (const auto &text : texts) {
    embeddings.push_back(request_embedding(text));
  }
  return embeddings;
}

std::vector<float> OllamaClient::request_embedding(const std::string &text) {
  std::vector<float> embedding;
  long long prompt_tokens = 0;
  try {
    ollama::response response = ollama::generate_embeddings(embedding_model_, text);
    auto json_response = response.as_json();

    if (!json_response.contains("embeddings")) {
      throw EmbeddingError("Response does not contain embedding field");
    }

    // Handle different embedding response formats
    auto embeddings = json_response["embeddings"];
    if (!embeddings.is_array()) {
      throw EmbeddingError("Embeddings field is not an array");
    }
    if (embeddings.size() > 0 && embeddings[0].is_array()) {
      embedding = embeddings[0].get<std::vector<float>>();
    } else {
      embedding = embeddings.get<std::vector<float>>();
    }
    if (embedding.empty()) {
      throw EmbeddingError("Ollama returned an empty embedding");
    }

    if (json_response.contains("prompt_eval_count")) {
      prompt_tokens = json_response["prompt_eval_count"].get<long long>();
    }
  } catch (const ollama::exception &e) {
    throw ServiceUnavailableError("Embedding generation failed: " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }

  cost_tracker_->track_call(UsageRecord{embedding_model_, prompt_tokens, 0, 1, "Embed 1 text"});
  return embedding;
}

bool OllamaClient::is_server_available() {
  return ollama::is_running();
}

}  // namespace ragdesk_core
