#include "fitscore/vector/similarity.h"

#include <algorithm>
#include <cmath>

namespace fitscore::vector {

core::Result<double, core::SimilarityError> cosine_similarity(const Vector& a, const Vector& b) {
  using R = core::Result<double, core::SimilarityError>;

  if (a.size() != b.size()) {
    return R::err(core::SimilarityError::kDimensionMismatch);
  }

  double dot_product = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (size_t i = 0; i < a.size(); ++i) {
    const double x = a[i];
    const double y = b[i];
    dot_product += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return R::ok(0.0);
  }

  // sqrt(norm_a * norm_b) is commutative and exact for a == b, so sim(a,a) is exactly 1.
  const double similarity = dot_product / std::sqrt(norm_a * norm_b);
  return R::ok(std::clamp(similarity, -1.0, 1.0));
}

bool has_magnitude(const Vector& v) {
  return std::any_of(v.begin(), v.end(), [](float x) { return x != 0.0f; });
}

}  // namespace fitscore::vector
