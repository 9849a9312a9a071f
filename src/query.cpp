#include "query.hpp"
#include "vector_store.hpp"
#include "errors.hpp"
#include <iostream>
#include <unordered_set>

namespace vecanalogy {

namespace {

NearestNeighborSearch::Config SearchConfig(const AnalogyQuery::Config& config) {
    NearestNeighborSearch::Config search_config;
    search_config.metric = config.metric;
    search_config.num_threads = config.num_threads;
    return search_config;
}

} // namespace

std::optional<Mode> ParseMode(const std::string& name) {
    if (name == "sum") return Mode::kSum;
    if (name == "average" || name == "avg") return Mode::kAverage;
    if (name == "expression" || name == "expr") return Mode::kExpression;
    return std::nullopt;
}

std::optional<Metric> ParseMetric(const std::string& name) {
    if (name == "cosine") return Metric::kCosine;
    if (name == "euclidean") return Metric::kEuclidean;
    return std::nullopt;
}

AnalogyQuery::AnalogyQuery(const VectorStore& store, const Config& config)
    : store_(store), config_(config), search_(store, SearchConfig(config)) {}

Combination AnalogyQuery::Combine(const std::vector<std::string>& tokens) const {
    Combination combination;
    if (config_.mode == Mode::kExpression) {
        combination = ExpressionEvaluator(store_).Evaluate(tokens);
    } else {
        combination = Aggregate(tokens);
    }

    if (combination.used_words.empty()) {
        throw EmptyInput("No valid input words found in the vocabulary");
    }
    return combination;
}

// sum / average 模式：忽略运算符，只收集已知词的向量
Combination AnalogyQuery::Aggregate(const std::vector<std::string>& tokens) const {
    Combination result;
    std::vector<const Vector*> found;

    for (const auto& token : tokens) {
        if (ExpressionEvaluator::IsOperator(token)) {
            std::cerr << "Warning: operator '" << token << "' ignored in "
                      << (config_.mode == Mode::kSum ? "sum" : "average") << " mode.\n";
            continue;
        }
        if (const Vector* vec = store_.Find(token)) {
            found.push_back(vec);
            result.used_words.push_back(token);
        } else {
            std::cerr << "Warning: '" << token << "' not in vocabulary, skipping.\n";
            result.unknown_words.push_back(token);
        }
    }

    if (found.empty()) {
        return result;
    }
    result.vector = config_.mode == Mode::kSum ? Sum(found) : Average(found);
    return result;
}

QueryResult AnalogyQuery::Run(const std::vector<std::string>& tokens) const {
    QueryResult result;
    result.combination = Combine(tokens);

    std::unordered_set<std::string> exclude;
    if (config_.exclude_inputs) {
        for (const auto& token : tokens) {
            if (!ExpressionEvaluator::IsOperator(token)) {
                exclude.insert(token);
            }
        }
    }

    result.neighbors = search_.FindNearestK(result.combination.vector, exclude, config_.top_k);
    return result;
}

} // namespace vecanalogy
