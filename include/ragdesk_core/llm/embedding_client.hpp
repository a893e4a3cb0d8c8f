#pragma once

#include <string>
#include <vector>

namespace ragdesk_core {

// Malformed or unexpected responses from the embedding service
class EmbeddingError : public std::exception {
 public:
  explicit EmbeddingError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Missing or rejected credential. Retrying will not help.
class AuthenticationError : public EmbeddingError {
 public:
  using EmbeddingError::EmbeddingError;
};

// Network failure, rate limiting or a server-side error. Safe to retry with backoff.
class ServiceUnavailableError : public EmbeddingError {
 public:
  using EmbeddingError::EmbeddingError;
};

class EmbeddingClient {
 public:
  virtual ~EmbeddingClient() = default;

  // One vector per input text, in input order. Empty input makes no remote call.
  virtual std::vector<std::vector<float>> get_embeddings(const std::vector<std::string> &texts) = 0;

  virtual const std::string &model() const = 0;

  // Embeds a single text
  std::vector<float> get_embedding(const std::string &text);
};

}  // namespace ragdesk_core
