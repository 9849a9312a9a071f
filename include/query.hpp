#pragma once

#include <optional>
#include <string>
#include <vector>
#include "expression.hpp"
#include "nearest_neighbor.hpp"

namespace vecanalogy {

class VectorStore;

enum class Mode {
    kSum,         // 所有词相加
    kAverage,     // 所有词取平均
    kExpression,  // 带 +/- 的表达式
};

std::optional<Mode> ParseMode(const std::string& name);
std::optional<Metric> ParseMetric(const std::string& name);

struct QueryResult {
    Combination combination;
    std::vector<Neighbor> neighbors;  // 空表示没有找到结果
};

// 组合输入词的向量并查找最近邻
class AnalogyQuery {
public:
    struct Config {
        Mode mode = Mode::kExpression;
        Metric metric = Metric::kCosine;
        bool exclude_inputs = true;  // 结果中排除输入的词
        size_t top_k = 1;
        int num_threads = 1;

        Config() = default;
    };

    AnalogyQuery(const VectorStore& store, const Config& config);

    // 没有任何有效输入词时抛出 EmptyInput
    QueryResult Run(const std::vector<std::string>& tokens) const;

    // 只计算组合向量
    Combination Combine(const std::vector<std::string>& tokens) const;

private:
    const VectorStore& store_;
    Config config_;
    NearestNeighborSearch search_;

    Combination Aggregate(const std::vector<std::string>& tokens) const;
};

} // namespace vecanalogy
