#include "expression.hpp"
#include "vector_store.hpp"
#include <iostream>

namespace vecanalogy {

Combination ExpressionEvaluator::Evaluate(const std::vector<std::string>& tokens) const {
    Combination result;
    result.vector = Zeros(store_.Dimension());

    float sign = 1.0f;  // +1 加, -1 减
    for (const auto& token : tokens) {
        if (token == "+") {
            sign = 1.0f;
        } else if (token == "-") {
            sign = -1.0f;
        } else if (const Vector* vec = store_.Find(token)) {
            AddInPlace(result.vector, *vec, sign);
            result.used_words.push_back(token);
        } else {
            std::cerr << "Warning: '" << token << "' not in vocabulary, skipping.\n";
            result.unknown_words.push_back(token);
        }
    }
    return result;
}

} // namespace vecanalogy
