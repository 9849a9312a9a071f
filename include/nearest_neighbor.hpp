#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "vector_algebra.hpp"

namespace vecanalogy {

class VectorStore;

enum class Metric {
    kCosine,     // 余弦相似度，越大越好
    kEuclidean,  // 欧氏距离，越小越好
};

// "cosine similarity" / "euclidean distance"
const char* MetricLabel(Metric metric);

struct Neighbor {
    std::string word;
    float score;
};

// 在整个词表上线性扫描
class NearestNeighborSearch {
public:
    struct Config {
        Metric metric = Metric::kCosine;
        int num_threads = 1;  // >1 时按连续区间分给多个线程扫描

        Config() = default;
    };

    NearestNeighborSearch(const VectorStore& store, const Config& config);

    // 最佳的一个；词表为空或全部被排除时返回 std::nullopt
    std::optional<Neighbor> FindNearest(const Vector& target,
                                        const std::unordered_set<std::string>& exclude) const;

    // 最佳的 k 个，按得分从好到差排列；同分时保持词表顺序
    std::vector<Neighbor> FindNearestK(const Vector& target,
                                       const std::unordered_set<std::string>& exclude,
                                       size_t k) const;

    float Score(const Vector& target, const Vector& candidate) const;
    bool IsBetter(float lhs, float rhs) const;

    // 实际使用的扫描线程数
    size_t WorkerCount(size_t table_size) const;

private:
    struct Candidate {
        size_t index;
        float score;
    };

    const VectorStore& store_;
    Config config_;

    std::vector<Candidate> ScanRange(size_t begin, size_t end, const Vector& target,
                                     const std::unordered_set<std::string>& exclude,
                                     size_t k) const;
    bool CandidateBetter(const Candidate& a, const Candidate& b) const;
};

} // namespace vecanalogy
