#pragma once

#include "fitscore/vector/similarity.h"

#include <string_view>

namespace fitscore::embedding {

// IEmbeddingProvider is the boundary to the external embedding collaborator.
// The matching engine never calls it: profiles arrive with vectors already attached.
// Applications (CLI, tests) use it to fill vectors for text-only profile sections.
class IEmbeddingProvider {
 public:
  virtual ~IEmbeddingProvider() = default;

  // embed_text converts text to a fixed-dimension vector.
  // Determinism: for the same text, must return the same vector.
  [[nodiscard]] virtual vector::Vector embed_text(std::string_view text) const = 0;

  // dimension returns the embedding vector dimension.
  [[nodiscard]] virtual size_t dimension() const = 0;
};

// DeterministicStubEmbeddingProvider generates stable vectors without a model.
// Strategy: signed feature hashing of lowercase tokens, L2-normalized.
// Texts sharing vocabulary land close together; the empty text maps to the zero vector.
class DeterministicStubEmbeddingProvider final : public IEmbeddingProvider {
 public:
  explicit DeterministicStubEmbeddingProvider(size_t dim = 768);

  [[nodiscard]] vector::Vector embed_text(std::string_view text) const override;
  [[nodiscard]] size_t dimension() const override { return dimension_; }

 private:
  size_t dimension_;
};

}  // namespace fitscore::embedding
