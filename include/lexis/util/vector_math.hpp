#pragma once

#include <cstddef>

namespace lexis::util {

// Euclidean norm, accumulated in double precision
float l2_norm(const float* x, size_t n);

double dot(const float* x, const float* y, size_t n);

/// Cosine similarity from precomputed norms; 0 when either norm is 0.
float cosine_similarity(const float* x, float x_norm,
                        const float* y, float y_norm, size_t n);

bool all_zero(const float* x, size_t n) noexcept;

} // namespace lexis::util
