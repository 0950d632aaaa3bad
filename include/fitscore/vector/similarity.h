#pragma once

#include "fitscore/core/result.h"

#include <vector>

namespace fitscore::vector {

using Vector = std::vector<float>;

// cosine_similarity returns the cosine of the angle between a and b, in [-1, 1].
//
// - a.size() != b.size()           -> err(kDimensionMismatch)
// - either vector empty or all-zero -> ok(0.0); absent content must not poison aggregation
// - symmetric: cosine_similarity(a, b) == cosine_similarity(b, a) bit-for-bit
//
// Accumulation is done in double precision in index order, so results are reproducible.
[[nodiscard]] core::Result<double, core::SimilarityError> cosine_similarity(const Vector& a,
                                                                            const Vector& b);

// has_magnitude reports whether v carries any non-zero component.
[[nodiscard]] bool has_magnitude(const Vector& v);

}  // namespace fitscore::vector
