#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <istream>
#include <utility>

namespace vecanalogy {

struct WordVector {
    std::string word;
    std::vector<float> vec;

    WordVector(const std::string& w = "", std::vector<float> v = {})
        : word(w), vec(std::move(v)) {}
};

// 词向量表：加载后只读
class VectorStore {
public:
    struct Config {
        std::optional<size_t> expected_dim;  // 未设置时由第一行确定
        bool lenient = false;                // true: 跳过坏行; false: 遇到坏行直接失败
        bool verbose = true;                 // 在 stderr 输出加载进度

        Config() = default;
    };

    VectorStore() = default;

    // 从文本文件加载 (每行: <word> <f_1> ... <f_d>)
    static VectorStore Load(const std::string& filename, const Config& config);
    static VectorStore LoadFromStream(std::istream& in, const std::string& source_name,
                                      const Config& config);

    // 查询
    const std::vector<float>* Find(const std::string& word) const;
    bool Contains(const std::string& word) const { return Find(word) != nullptr; }
    const WordVector& GetEntry(size_t index) const { return entries_[index]; }
    size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }
    size_t Dimension() const { return dim_; }
    size_t SkippedRows() const { return skipped_rows_; }

    std::vector<WordVector>::const_iterator begin() const { return entries_.begin(); }
    std::vector<WordVector>::const_iterator end() const { return entries_.end(); }

private:
    // 按首次出现的顺序保存
    std::vector<WordVector> entries_;
    std::unordered_map<std::string, size_t> word_to_index_;
    size_t dim_ = 0;
    size_t skipped_rows_ = 0;

    void Insert(const std::string& word, std::vector<float> vec);
};

} // namespace vecanalogy
