#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/cost/cost_tracker.hpp"
#include "ragdesk_core/llm/embedding_client.hpp"
#include "ragdesk_core/llm/http_transport.hpp"

namespace ragdesk_core {

struct OpenAIEmbeddingOptions {
  std::string url = "https://api.openai.com/v1/embeddings";
  std::string model = "text-embedding-3-small";
  std::string api_key;
  // Inputs per request; larger batches are split into sequential requests
  size_t batch_size = 512;
};

/**
 * @class OpenAIEmbeddingClient
 * @brief Client for OpenAI-compatible /v1/embeddings endpoints.
 *
 * Usage of every successful request is handed to the CostTracker before the
 * next request is sent, so a failure part way through a large batch still
 * accounts for what was already spent.
 */
class OpenAIEmbeddingClient : public EmbeddingClient {
 public:
  OpenAIEmbeddingClient(OpenAIEmbeddingOptions options,
                        std::shared_ptr<HttpTransport> transport,
                        std::shared_ptr<CostTracker> cost_tracker);

  OpenAIEmbeddingClient(const OpenAIEmbeddingClient &) = delete;
  OpenAIEmbeddingClient &operator=(const OpenAIEmbeddingClient &) = delete;

  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  const std::string &model() const override {
    return options_.model;
  }

 private:
  OpenAIEmbeddingOptions options_;
  std::shared_ptr<HttpTransport> transport_;
  std::shared_ptr<CostTracker> cost_tracker_;

  std::vector<std::vector<float>> request_batch(const std::vector<std::string> &texts);
  void raise_for_status(const HttpResponse &response) const;
};

}  // namespace ragdesk_core
