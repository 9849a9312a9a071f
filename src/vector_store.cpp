#include "vector_store.hpp"
#include "errors.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace vecanalogy {

namespace {

// 整个 token 必须是合法的有限 float
bool ParseFloat(const std::string& token, float& value) {
    const char* begin = token.c_str();
    char* end = nullptr;
    value = std::strtof(begin, &end);
    if (end == begin || *end != '\0') return false;
    // 溢出时 strtof 返回 HUGE_VALF
    return std::isfinite(value);
}

} // namespace

VectorStore VectorStore::Load(const std::string& filename, const Config& config) {
    std::ifstream file(filename);
    if (!file) {
        throw IOError("Cannot open vector file: " + filename);
    }

    if (config.verbose) {
        std::cerr << "Loading vectors from " << filename << "...\n";
    }

    VectorStore store = LoadFromStream(file, filename, config);
    if (file.bad()) {
        throw IOError("Error while reading vector file: " + filename);
    }
    return store;
}

VectorStore VectorStore::LoadFromStream(std::istream& in, const std::string& source_name,
                                        const Config& config) {
    VectorStore store;
    if (config.expected_dim) {
        store.dim_ = *config.expected_dim;
    }

    std::string line;
    std::string word;
    std::string token;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;

        std::istringstream fields(line);
        if (!(fields >> word)) continue;  // 空行

        try {
            std::vector<float> vec;
            vec.reserve(store.dim_);
            while (fields >> token) {
                float value;
                if (!ParseFloat(token, value)) {
                    throw ParseError(source_name, line_no,
                                     "invalid number '" + token + "' for word '" + word + "'");
                }
                vec.push_back(value);
            }

            if (vec.empty()) {
                throw ParseError(source_name, line_no, "no vector components for word '" + word + "'");
            }
            if (store.dim_ != 0 && vec.size() != store.dim_) {
                throw ParseError(source_name, line_no,
                                 "expected " + std::to_string(store.dim_) + " components for word '" +
                                 word + "', found " + std::to_string(vec.size()));
            }

            store.dim_ = vec.size();
            store.Insert(word, std::move(vec));
        } catch (const ParseError& e) {
            if (!config.lenient) throw;
            std::cerr << "Warning: skipping row: " << e.what() << "\n";
            store.skipped_rows_++;
        }
    }

    if (config.verbose) {
        std::cerr << "Vocabulary size: " << store.Size()
                  << ", Vector size: " << store.dim_ << "\n";
        if (store.skipped_rows_ > 0) {
            std::cerr << "Skipped rows: " << store.skipped_rows_ << "\n";
        }
    }
    return store;
}

void VectorStore::Insert(const std::string& word, std::vector<float> vec) {
    auto it = word_to_index_.find(word);
    if (it == word_to_index_.end()) {
        // 新词
        word_to_index_[word] = entries_.size();
        entries_.emplace_back(word, std::move(vec));
    } else {
        // 重复的词：后出现的覆盖，位置不变
        entries_[it->second].vec = std::move(vec);
    }
}

const std::vector<float>* VectorStore::Find(const std::string& word) const {
    auto it = word_to_index_.find(word);
    return it != word_to_index_.end() ? &entries_[it->second].vec : nullptr;
}

} // namespace vecanalogy
