#pragma once

#include <cstddef>
#include <vector>

namespace vecanalogy {

using Vector = std::vector<float>;

// 逐元素运算，长度不同时抛出 DimensionMismatch
Vector Add(const Vector& a, const Vector& b);
Vector Subtract(const Vector& a, const Vector& b);

// acc += scale * v
void AddInPlace(Vector& acc, const Vector& v, float scale = 1.0f);

// 空序列抛出 EmptyInput
Vector Sum(const std::vector<const Vector*>& vectors);
Vector Average(const std::vector<const Vector*>& vectors);

Vector Zeros(size_t dim);

float Dot(const Vector& a, const Vector& b);
float Norm(const Vector& v);

// 任一向量范数为 0 时返回 0.0
float CosineSimilarity(const Vector& a, const Vector& b);
float EuclideanDistance(const Vector& a, const Vector& b);

} // namespace vecanalogy
