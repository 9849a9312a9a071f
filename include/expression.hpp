#pragma once

#include <string>
#include <vector>
#include "vector_algebra.hpp"

namespace vecanalogy {

class VectorStore;

struct Combination {
    Vector vector;
    std::vector<std::string> used_words;     // 在词表中找到的词 (按出现顺序)
    std::vector<std::string> unknown_words;  // 被跳过的词
};

// 解析 "king - man + woman" 形式的 token 序列
class ExpressionEvaluator {
public:
    explicit ExpressionEvaluator(const VectorStore& store) : store_(store) {}

    // 未知词输出警告并跳过，不会失败
    Combination Evaluate(const std::vector<std::string>& tokens) const;

    static bool IsOperator(const std::string& token) { return token == "+" || token == "-"; }

private:
    const VectorStore& store_;
};

} // namespace vecanalogy
