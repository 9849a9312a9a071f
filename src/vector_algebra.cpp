#include "vector_algebra.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace vecanalogy {

namespace {

void CheckSameSize(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) {
        throw DimensionMismatch(a.size(), b.size());
    }
}

// float 累加在分量较大 (如 1e20) 时会溢出，统一用 double 累加
double DotAccumulate(const Vector& a, const Vector& b) {
    CheckSameSize(a, b);
    double dot = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
    }
    return dot;
}

double SquaredNormAccumulate(const Vector& v) {
    double norm = 0.0;
    for (float x : v) {
        norm += static_cast<double>(x) * x;
    }
    return norm;
}

} // namespace

Vector Add(const Vector& a, const Vector& b) {
    Vector result(a);
    AddInPlace(result, b, 1.0f);
    return result;
}

Vector Subtract(const Vector& a, const Vector& b) {
    Vector result(a);
    AddInPlace(result, b, -1.0f);
    return result;
}

void AddInPlace(Vector& acc, const Vector& v, float scale) {
    CheckSameSize(acc, v);
    for (size_t i = 0; i < acc.size(); ++i) {
        acc[i] += scale * v[i];
    }
}

Vector Sum(const std::vector<const Vector*>& vectors) {
    if (vectors.empty()) {
        throw EmptyInput("Cannot sum an empty list of vectors");
    }
    Vector sum(vectors[0]->size(), 0.0f);
    for (const Vector* v : vectors) {
        AddInPlace(sum, *v);
    }
    return sum;
}

Vector Average(const std::vector<const Vector*>& vectors) {
    if (vectors.empty()) {
        throw EmptyInput("Cannot average an empty list of vectors");
    }
    Vector avg = Sum(vectors);
    const float count = static_cast<float>(vectors.size());
    for (float& v : avg) {
        v /= count;
    }
    return avg;
}

Vector Zeros(size_t dim) {
    return Vector(dim, 0.0f);
}

float Dot(const Vector& a, const Vector& b) {
    return static_cast<float>(DotAccumulate(a, b));
}

float Norm(const Vector& v) {
    return static_cast<float>(std::sqrt(SquaredNormAccumulate(v)));
}

// 计算余弦相似度
float CosineSimilarity(const Vector& a, const Vector& b) {
    const double dot = DotAccumulate(a, b);
    const double norm_a = std::sqrt(SquaredNormAccumulate(a));
    const double norm_b = std::sqrt(SquaredNormAccumulate(b));
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0f;
    }
    const double cosine = dot / (norm_a * norm_b);
    return static_cast<float>(std::min(1.0, std::max(-1.0, cosine)));
}

float EuclideanDistance(const Vector& a, const Vector& b) {
    CheckSameSize(a, b);
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - b[i];
        sum += d * d;
    }
    return static_cast<float>(std::sqrt(sum));
}

} // namespace vecanalogy
