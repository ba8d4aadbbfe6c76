#pragma once

#include <vector>

namespace dr {

// Cosine similarity in [-1, 1]. Returns 0 for mismatched sizes or a zero vector.
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

double dotProduct(const std::vector<float>& a, const std::vector<float>& b);
double l2Norm(const std::vector<float>& v);

// Returns v scaled to unit length; a zero vector is returned unchanged.
std::vector<float> l2Normalize(std::vector<float> v);

bool isZeroVector(const std::vector<float>& v);

// True when v has the expected size and only finite components.
bool isValidVector(const std::vector<float>& v, int dimensions);

} // namespace dr
