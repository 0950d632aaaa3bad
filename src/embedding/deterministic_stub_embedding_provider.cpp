#include "fitscore/core/hashing.h"
#include "fitscore/core/normalization.h"
#include "fitscore/embedding/embedding_provider.h"

#include <cmath>
#include <map>
#include <string>

namespace fitscore::embedding {

DeterministicStubEmbeddingProvider::DeterministicStubEmbeddingProvider(size_t dim)
    : dimension_(dim) {}

vector::Vector DeterministicStubEmbeddingProvider::embed_text(std::string_view text) const {
  if (dimension_ == 0) {
    return {};
  }

  vector::Vector embedding(dimension_, 0.0f);

  // Single characters such as "c" or "r" are meaningful skill names, so keep them.
  const auto tokens = core::tokenize_ascii(text, 1);
  if (tokens.empty()) {
    return embedding;
  }

  std::map<std::string, int> token_counts;
  for (const auto& token : tokens) {
    token_counts[token]++;
  }

  for (const auto& [token, count] : token_counts) {
    const std::uint64_t bucket_hash = core::stable_hash64(token);
    const std::uint64_t sign_hash = core::stable_hash64(token, 0x9e3779b97f4a7c15ull);

    const size_t idx = bucket_hash % dimension_;
    const float sign = (sign_hash & 1u) != 0u ? 1.0f : -1.0f;
    // Sub-linear term frequency keeps long narratives from being dominated by filler words.
    const float weight = 1.0f + std::log(static_cast<float>(count));

    embedding[idx] += sign * weight;
  }

  float norm = 0.0f;
  for (const float val : embedding) {
    norm += val * val;
  }

  if (norm > 0.0f) {
    norm = std::sqrt(norm);
    for (float& val : embedding) {
      val /= norm;
    }
  }

  return embedding;
}

}  // namespace fitscore::embedding
