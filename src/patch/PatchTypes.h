#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief apply_patch 的错误类型
 *
 * 解析期 (格式错误)、校验期 (前置条件)、应用期 (上下文找不到 / IO) 全部走这一个异常,
 * 由 kind 区分。line 为补丁文本中的 1-based 行号, 0 表示不适用。
 */
class PatchError : public std::runtime_error {
public:
    enum class Kind {
        MalformedPatch,
        InvalidHunkHeader,
        EmptyUpdateHunk,
        MissingContextMarker,
        UnexpectedLine,
        EmptyChunk,
        InvalidInput,
        Precondition,
        ContextNotFound,
        Io
    };

    PatchError(Kind kind, const std::string& message, size_t line = 0)
        : std::runtime_error(message), kind_(kind), line_(line) {}

    Kind kind() const { return kind_; }
    size_t line() const { return line_; }

private:
    Kind kind_;
    size_t line_;
};

/**
 * @brief Update 块中的一个 chunk
 *
 * oldLines 为 context + 删除行, newLines 为 context + 新增行 (均已去掉前缀)。
 * oldLines 为空表示纯插入。
 */
struct UpdateChunk {
    std::optional<std::string> changeContext;
    std::vector<std::string> oldLines;
    std::vector<std::string> newLines;
    bool isEndOfFile = false;
};

enum class HunkKind {
    Add,
    Delete,
    Update
};

/**
 * @brief 补丁中的一个顶层指令 (单个文件)
 *
 * - Add: path + contents
 * - Delete: path
 * - Update: path + 可选 movePath + 至少一个 chunk
 */
struct Hunk {
    HunkKind kind = HunkKind::Add;
    std::string path;
    std::string movePath;
    std::string contents;
    std::vector<UpdateChunk> chunks;
};

struct Patch {
    std::vector<Hunk> hunks;
};

/**
 * @brief 针对文件原始行数组计算出的一次编辑
 */
struct Replacement {
    size_t startIndex = 0;
    size_t oldLength = 0;
    std::vector<std::string> newLines;
};

enum class ChangeOperation {
    Add,
    Delete,
    Update
};

std::string toString(ChangeOperation op);

struct FileChange {
    std::string path;
    ChangeOperation operation = ChangeOperation::Add;
    std::string oldContent;
    std::string newContent;
    std::string unifiedDiff;
    std::string movePath;
};

/**
 * @brief 一次 apply_patch 调用的结果
 *
 * error 非空表示失败; 失败前已应用的 hunk 仍记录在 added/modified/deleted 中。
 */
struct ApplyPatchResult {
    std::vector<std::string> added;
    std::vector<std::string> modified;
    std::vector<std::string> deleted;
    std::vector<FileChange> changes;
    std::string error;

    bool isError() const { return !error.empty(); }

    // "Success. Updated the following files:" + A/M/D 列表; 出错时为空串
    std::string summary() const;

    nlohmann::json toJson() const;
};
