#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vecanalogy {

// 所有错误的基类
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// 向量文件无法打开/读取
class IOError : public Error {
public:
    explicit IOError(const std::string& what) : Error(what) {}
};

// 行格式错误：非数字字段或维度不一致
class ParseError : public Error {
public:
    ParseError(const std::string& source, size_t line, const std::string& reason)
        : Error(source + ":" + std::to_string(line) + ": " + reason),
          line_(line), reason_(reason) {}

    size_t line() const { return line_; }
    const std::string& reason() const { return reason_; }

private:
    size_t line_;
    std::string reason_;
};

// 两个向量长度不同
class DimensionMismatch : public Error {
public:
    DimensionMismatch(size_t lhs, size_t rhs)
        : Error("Dimension mismatch: " + std::to_string(lhs) + " vs " +
                std::to_string(rhs)) {}
};

// 没有可聚合的向量
class EmptyInput : public Error {
public:
    explicit EmptyInput(const std::string& what = "No valid input words")
        : Error(what) {}
};

} // namespace vecanalogy
