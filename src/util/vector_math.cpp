#include "lexis/util/vector_math.hpp"

#include <Eigen/Dense>
#include <cmath>

namespace lexis::util {

float l2_norm(const float* x, size_t n) {
    if (n == 0) return 0.0f;
    Eigen::Map<const Eigen::VectorXf> vx(x, static_cast<Eigen::Index>(n));
    return static_cast<float>(std::sqrt(vx.cast<double>().squaredNorm()));
}

double dot(const float* x, const float* y, size_t n) {
    if (n == 0) return 0.0;
    Eigen::Map<const Eigen::VectorXf> vx(x, static_cast<Eigen::Index>(n));
    Eigen::Map<const Eigen::VectorXf> vy(y, static_cast<Eigen::Index>(n));
    return vx.cast<double>().dot(vy.cast<double>());
}

float cosine_similarity(const float* x, float x_norm,
                        const float* y, float y_norm, size_t n) {
    if (x_norm == 0.0f || y_norm == 0.0f) return 0.0f;
    return static_cast<float>(dot(x, y, n) / (static_cast<double>(x_norm) * y_norm));
}

bool all_zero(const float* x, size_t n) noexcept {
    for (size_t i = 0; i < n; ++i) {
        if (x[i] != 0.0f) return false;
    }
    return true;
}

} // namespace lexis::util
