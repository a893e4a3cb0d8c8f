#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragdesk_core/cost/cost_tracker.hpp"
#include "ragdesk_core/llm/embedding_client.hpp"

namespace ragdesk_core {

// Embeds through a local Ollama server. No credential is involved; an
// unreachable server is reported as ServiceUnavailableError.
class OllamaClient : public EmbeddingClient {
 public:
  OllamaClient(const std::string &ollama_url,
               const std::string &embedding_model,
               std::shared_ptr<CostTracker> cost_tracker);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) override;

  const std::string &model() const override {
    return embedding_model_;
  }

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  std::shared_ptr<CostTracker> cost_tracker_;

  std::vector<float> request_embedding(const std::string &text);
};

}  // namespace ragdesk_core
