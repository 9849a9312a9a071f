#include "nearest_neighbor.hpp"
#include "vector_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <thread>

namespace vecanalogy {

const char* MetricLabel(Metric metric) {
    switch (metric) {
        case Metric::kCosine:
            return "cosine similarity";
        case Metric::kEuclidean:
            return "euclidean distance";
    }
    return "score";
}

NearestNeighborSearch::NearestNeighborSearch(const VectorStore& store, const Config& config)
    : store_(store), config_(config) {}

float NearestNeighborSearch::Score(const Vector& target, const Vector& candidate) const {
    if (config_.metric == Metric::kCosine) {
        return CosineSimilarity(target, candidate);
    }
    return EuclideanDistance(target, candidate);
}

// NaN 视为最差的得分，保证比较是严格弱序
bool NearestNeighborSearch::IsBetter(float lhs, float rhs) const {
    if (std::isnan(lhs)) return false;
    if (std::isnan(rhs)) return true;
    return config_.metric == Metric::kCosine ? lhs > rhs : lhs < rhs;
}

// 同分时词表中靠前的胜出
bool NearestNeighborSearch::CandidateBetter(const Candidate& a, const Candidate& b) const {
    if (IsBetter(a.score, b.score)) return true;
    if (IsBetter(b.score, a.score)) return false;
    return a.index < b.index;
}

// 不超过词表大小和硬件线程数
size_t NearestNeighborSearch::WorkerCount(size_t table_size) const {
    size_t count = static_cast<size_t>(std::max(config_.num_threads, 1));
    const size_t hardware = std::thread::hardware_concurrency();
    if (hardware > 0) {
        count = std::min(count, hardware);
    }
    return std::max<size_t>(1, std::min(count, table_size));
}

std::optional<Neighbor> NearestNeighborSearch::FindNearest(
        const Vector& target, const std::unordered_set<std::string>& exclude) const {
    std::vector<Neighbor> best = FindNearestK(target, exclude, 1);
    if (best.empty()) {
        return std::nullopt;
    }
    return best.front();
}

std::vector<NearestNeighborSearch::Candidate> NearestNeighborSearch::ScanRange(
        size_t begin, size_t end, const Vector& target,
        const std::unordered_set<std::string>& exclude, size_t k) const {
    // 堆顶是当前最差的候选 (与 word2vec distance 工具的 top-N 小根堆相同)
    auto cmp = [this](const Candidate& a, const Candidate& b) {
        return CandidateBetter(a, b);
    };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(cmp)> top(cmp);

    for (size_t i = begin; i < end; ++i) {
        const WordVector& entry = store_.GetEntry(i);
        if (exclude.count(entry.word) > 0) {
            continue;
        }

        Candidate c{i, Score(target, entry.vec)};
        if (top.size() < k) {
            top.push(c);
        } else if (CandidateBetter(c, top.top())) {
            top.pop();
            top.push(c);
        }
    }

    std::vector<Candidate> results;
    results.reserve(top.size());
    while (!top.empty()) {
        results.push_back(top.top());
        top.pop();
    }
    std::reverse(results.begin(), results.end());
    return results;
}

std::vector<Neighbor> NearestNeighborSearch::FindNearestK(
        const Vector& target, const std::unordered_set<std::string>& exclude, size_t k) const {
    std::vector<Neighbor> neighbors;
    if (k == 0 || store_.Empty()) {
        return neighbors;
    }
    if (target.size() != store_.Dimension()) {
        throw DimensionMismatch(target.size(), store_.Dimension());
    }

    const size_t size = store_.Size();
    const size_t num_threads = WorkerCount(size);

    std::vector<std::vector<Candidate>> partial(num_threads);
    if (num_threads == 1) {
        partial[0] = ScanRange(0, size, target, exclude, k);
    } else {
        // 每个线程负责一段连续区间
        const size_t chunk = (size + num_threads - 1) / num_threads;
        std::vector<std::thread> threads;
        threads.reserve(num_threads);
        try {
            for (size_t t = 0; t < num_threads; ++t) {
                const size_t begin = std::min(t * chunk, size);
                const size_t end = std::min(begin + chunk, size);
                threads.emplace_back([this, t, begin, end, k, &partial, &target, &exclude]() {
                    partial[t] = ScanRange(begin, end, target, exclude, k);
                });
            }
        } catch (...) {
            // 创建线程失败时先等待已启动的线程，再把异常交给调用方
            for (auto& thread : threads) {
                thread.join();
            }
            throw;
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    // 合并各区间的结果
    std::vector<Candidate> merged;
    for (const auto& p : partial) {
        merged.insert(merged.end(), p.begin(), p.end());
    }
    std::sort(merged.begin(), merged.end(),
              [this](const Candidate& a, const Candidate& b) { return CandidateBetter(a, b); });
    if (merged.size() > k) {
        merged.resize(k);
    }

    neighbors.reserve(merged.size());
    for (const Candidate& c : merged) {
        neighbors.push_back(Neighbor{store_.GetEntry(c.index).word, c.score});
    }
    return neighbors;
}

} // namespace vecanalogy
