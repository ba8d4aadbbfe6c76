#include "core/vector/vector_math.h"

#include <cmath>

namespace dr {

double dotProduct(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.size() != b.size()) {
        return 0.0;
    }
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    }
    return sum;
}

double l2Norm(const std::vector<float>& v)
{
    double sumSquares = 0.0;
    for (const float value : v) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }
    return std::sqrt(sumSquares);
}

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b)
{
    if (a.empty() || a.size() != b.size()) {
        return 0.0;
    }
    const double normA = l2Norm(a);
    const double normB = l2Norm(b);
    if (normA <= 0.0 || normB <= 0.0) {
        return 0.0;
    }
    return dotProduct(a, b) / (normA * normB);
}

std::vector<float> l2Normalize(std::vector<float> v)
{
    const double norm = l2Norm(v);
    if (norm <= 0.0) {
        return v;
    }
    for (float& value : v) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return v;
}

bool isZeroVector(const std::vector<float>& v)
{
    for (const float value : v) {
        if (value != 0.0f) {
            return false;
        }
    }
    return true;
}

bool isValidVector(const std::vector<float>& v, int dimensions)
{
    if (dimensions <= 0 || v.size() != static_cast<size_t>(dimensions)) {
        return false;
    }
    for (const float value : v) {
        if (!std::isfinite(value)) {
            return false;
        }
    }
    return true;
}

} // namespace dr
