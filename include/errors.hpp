#pragma once

#include <stdexcept>
#include <string>

namespace skipgram {

// 配置错误：缺少/无效的路径或参数，语料无法读取或为空
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// 词汇表错误：所有词都被 min_count 过滤，或语料太短无法生成样本
class VocabularyError : public std::runtime_error {
public:
    explicit VocabularyError(const std::string& what) : std::runtime_error(what) {}
};

// 必需的类比问题文件不存在
class AnalogyFileMissing : public std::runtime_error {
public:
    explicit AnalogyFileMissing(const std::string& what) : std::runtime_error(what) {}
};

// checkpoint 损坏或与当前模型不匹配
class CheckpointRestoreError : public std::runtime_error {
public:
    explicit CheckpointRestoreError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace skipgram
