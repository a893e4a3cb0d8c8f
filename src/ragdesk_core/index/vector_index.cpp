#include "ragdesk_core/index/vector_index.hpp"

#include <algorithm>

namespace ragdesk_core {

void VectorIndex::build(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    index_.reset();
    return;
  }

  const size_t dimension = vectors.front().size();
  if (dimension == 0) {
    throw VectorIndexError("Cannot index zero-dimensional vectors");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dimension);
  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension) {
      throw VectorIndexError("Vector dimension mismatch at position " + std::to_string(i) +
                             ". Expected " + std::to_string(dimension) + ", got " +
                             std::to_string(vectors[i].size()));
    }
    all_vectors_flat.insert(all_vectors_flat.end(), vectors[i].begin(), vectors[i].end());
  }

  // Build aside and swap in, so a failure keeps the previous index intact
  auto index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension));
  index->add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
  index_ = std::move(index);
}

std::vector<Neighbor> VectorIndex::query(const std::vector<float> &vector, size_t k) const {
  if (!index_ || index_->ntotal == 0) {
    throw EmptyIndexError("Vector index is empty. Load documents before searching.");
  }
  if (k == 0) {
    throw VectorIndexError("k must be at least 1");
  }
  if (vector.size() != dimension()) {
    throw VectorIndexError("Query vector dimension mismatch. Expected " +
                           std::to_string(dimension()) + ", got " +
                           std::to_string(vector.size()));
  }

  const faiss::idx_t actual_k = std::min(static_cast<faiss::idx_t>(k), index_->ntotal);
  std::vector<float> distances(static_cast<size_t>(actual_k));
  std::vector<faiss::idx_t> labels(static_cast<size_t>(actual_k));
  index_->search(1, vector.data(), actual_k, distances.data(), labels.data());

  std::vector<Neighbor> neighbors;
  neighbors.reserve(labels.size());
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] == -1) {
      continue;
    }
    neighbors.push_back(Neighbor{distances[i], static_cast<size_t>(labels[i])});
  }
  return neighbors;
}

void VectorIndex::clear() {
  index_.reset();
}

size_t VectorIndex::size() const {
  return index_ ? static_cast<size_t>(index_->ntotal) : 0;
}

size_t VectorIndex::dimension() const {
  return index_ ? static_cast<size_t>(index_->d) : 0;
}

}  // namespace ragdesk_core
