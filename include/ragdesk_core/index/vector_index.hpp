#pragma once

#include <faiss/IndexFlat.h>

#include <memory>
#include <string>
#include <vector>

namespace ragdesk_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Queried before any vectors were loaded. Expected state, not a bug.
class EmptyIndexError : public VectorIndexError {
 public:
  using VectorIndexError::VectorIndexError;
};

struct Neighbor {
  float distance;   // squared Euclidean distance
  size_t position;  // position of the vector passed to build()
};

/**
 * @class VectorIndex
 * @brief Exact nearest-neighbour search over an in-memory set of vectors.
 *
 * Wraps a flat faiss L2 index, so every query is a brute-force scan and the
 * reported distances are squared Euclidean distances over the raw vectors.
 * The index is always rebuilt as a whole; there is no incremental insert.
 */
class VectorIndex {
 public:
  VectorIndex() = default;
  ~VectorIndex() = default;

  VectorIndex(const VectorIndex &) = delete;
  VectorIndex &operator=(const VectorIndex &) = delete;
  VectorIndex(VectorIndex &&) noexcept = default;
  VectorIndex &operator=(VectorIndex &&) noexcept = default;

  // Replaces the current contents. An empty input leaves the index empty.
  void build(const std::vector<std::vector<float>> &vectors);

  // Up to k nearest vectors, closest first. Fewer than k stored vectors returns all of them.
  std::vector<Neighbor> query(const std::vector<float> &vector, size_t k) const;

  void clear();

  size_t size() const;
  bool empty() const {
    return size() == 0;
  }
  size_t dimension() const;

 private:
  std::unique_ptr<faiss::IndexFlatL2> index_;
};

}  // namespace ragdesk_core
