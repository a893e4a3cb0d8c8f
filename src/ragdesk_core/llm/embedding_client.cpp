#include "ragdesk_core/llm/embedding_client.hpp"

namespace ragdesk_core {

std::vector<float> EmbeddingClient::get_embedding(const std::string &text) {
  std::vector<std::vector<float>> embeddings = get_embeddings({text});
  if (embeddings.size() != 1) {
    throw EmbeddingError("Expected 1 embedding, got " + std::to_string(embeddings.size()));
  }
  return std::move(embeddings.front());
}

}  // namespace ragdesk_core
