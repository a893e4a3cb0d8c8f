#include "ragdesk_core/llm/openai_embedding_client.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>

namespace ragdesk_core {

namespace {

// Pulls error.message out of an API error body, falling back to the raw body
std::string api_error_message(const std::string &body) {
  try {
    auto json_body = nlohmann::json::parse(body);
    if (json_body.contains("error") && json_body["error"].is_object()) {
      return json_body["error"].value("message", body);
    }
  } catch (const nlohmann::json::exception &) {
    // Not JSON (proxy error pages and the like)
  }
  return body;
}

}  // namespace

OpenAIEmbeddingClient::OpenAIEmbeddingClient(OpenAIEmbeddingOptions options,
                                             std::shared_ptr<HttpTransport> transport,
                                             std::shared_ptr<CostTracker> cost_tracker)
    : options_(std::move(options)),
      transport_(std::move(transport)),
      cost_tracker_(std::move(cost_tracker)) {
  if (!transport_ || !cost_tracker_) {
    throw std::invalid_argument("OpenAIEmbeddingClient requires a transport and a cost tracker");
  }
  if (options_.batch_size == 0) {
    throw std::invalid_argument("Embedding batch size must be greater than 0");
  }
}

std::vector<std::vector<float>> OpenAIEmbeddingClient::get_embeddings(
    const std::vector<std::string> &texts) {
  if (texts.empty()) {
    return {};
  }
  if (options_.api_key.empty()) {
    throw AuthenticationError("Embedding API key is not configured");
  }

  std::vector<std::vector<float>> embeddings;
  embeddings.reserve(texts.size());
  for (size_t start = 0; start < texts.size(); start += options_.batch_size) {
    const size_t end = std::min(texts.size(), start + options_.batch_size);
    std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                   texts.begin() + static_cast<std::ptrdiff_t>(end));
    auto batch_embeddings = request_batch(batch);
    for (auto &embedding : batch_embeddings) {
      embeddings.push_back(std::move(embedding));
    }
  }
  return embeddings;
}

std::vector<std::vector<float>> OpenAIEmbeddingClient::request_batch(
    const std::vector<std::string> &texts) {
  nlohmann::json request_data = {{"model", options_.model}, {"input", texts}};
  const std::vector<std::string> headers = {"Authorization: Bearer " + options_.api_key};

  HttpResponse response;
  try {
    response = transport_->post_json(options_.url, headers, request_data.dump());
  } catch (const HttpTransportError &e) {
    throw ServiceUnavailableError("Embedding request failed: " + std::string(e.what()));
  }
  raise_for_status(response);

  std::vector<std::vector<float>> embeddings(texts.size());
  long long total_tokens = 0;
  try {
    auto json_response = nlohmann::json::parse(response.body);
    if (!json_response.contains("data") || !json_response["data"].is_array()) {
      throw EmbeddingError("Response does not contain a data array");
    }
    const auto &data = json_response["data"];
    if (data.size() != texts.size()) {
      throw EmbeddingError("Expected " + std::to_string(texts.size()) + " embeddings, got " +
                           std::to_string(data.size()));
    }

    // Items carry their input position; do not rely on response order
    for (size_t i = 0; i < data.size(); ++i) {
      const size_t position = data[i].value("index", i);
      if (position >= embeddings.size() || !embeddings[position].empty()) {
        throw EmbeddingError("Invalid embedding index " + std::to_string(position));
      }
      embeddings[position] = data[i].at("embedding").get<std::vector<float>>();
    }

    if (json_response.contains("usage")) {
      total_tokens = json_response["usage"].value("total_tokens", 0LL);
    }
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError("Malformed embedding response: " + std::string(e.what()));
  }

  cost_tracker_->track_call(UsageRecord{options_.model, total_tokens, 0, texts.size(),
                                        "Embed " + std::to_string(texts.size()) + " texts"});
  return embeddings;
}

void OpenAIEmbeddingClient::raise_for_status(const HttpResponse &response) const {
  const long status = response.status_code;
  if (status == 200) {
    return;
  }

  const std::string detail =
      "HTTP " + std::to_string(status) + ": " + api_error_message(response.body);
  if (status == 401 || status == 403) {
    throw AuthenticationError("Embedding service rejected the credential (" + detail + ")");
  }
  if (status == 408 || status == 429 || status >= 500) {
    throw ServiceUnavailableError("Embedding service unavailable (" + detail + ")");
  }
  throw EmbeddingError("Embedding request failed (" + detail + ")");
}

}  // namespace ragdesk_core
