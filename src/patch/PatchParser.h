#pragma once
#include "patch/PatchTypes.h"
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// 补丁 DSL 的固定标记
namespace PatchMarkers {
    constexpr const char* kBeginPatch = "*** Begin Patch";
    constexpr const char* kEndPatch = "*** End Patch";
    constexpr const char* kAddFile = "*** Add File: ";
    constexpr const char* kDeleteFile = "*** Delete File: ";
    constexpr const char* kUpdateFile = "*** Update File: ";
    constexpr const char* kMoveTo = "*** Move to: ";
    constexpr const char* kEndOfFile = "*** End of File";
    constexpr const char* kChangeContext = "@@ ";
    constexpr const char* kEmptyChangeContext = "@@";
}

/**
 * @brief Update chunk 内一行的分类 (按首字符)
 */
enum class ChunkLine {
    Context,    // ' '
    Addition,   // '+'
    Removal,    // '-'
    Blank,      // 空行, 视为一对空的旧/新行
    EndOfFile,  // *** End of File
    Other       // 其余: 结束当前 chunk
};

ChunkLine classifyChunkLine(const std::string& line);

/**
 * @brief 解析完整补丁文本
 *
 * 先做边界检查 (支持 <<EOF 包裹), 再逐个解析 hunk。纯函数, 不接触文件系统;
 * 路径保持补丁中的原样, 由 resolvePatchPaths 统一转成绝对路径。
 *
 * @throws PatchError 格式错误 (带 1-based 行号)
 */
Patch parsePatch(const std::string& text);

/**
 * @brief 边界归一化: 返回去掉 heredoc 包裹后的行 (含 Begin/End 标记)
 * @throws PatchError(MalformedPatch)
 */
std::vector<std::string> normalizePatchBoundaries(const std::vector<std::string>& lines);

/**
 * @brief 解析一个 Update chunk
 * @param lines 补丁行
 * @param begin chunk 在 lines 中的起始下标
 * @param lineNumber lines[begin] 在补丁中的行号
 * @param allowMissingContext 仅 hunk 的第一个 chunk 可省略 @@
 * @param consumed 输出: 消耗的行数
 */
UpdateChunk parseUpdateChunk(const std::vector<std::string>& lines, size_t begin, size_t lineNumber,
                             bool allowMissingContext, size_t& consumed);

/**
 * @brief 把 hunk 的 path / movePath 解析为规范化的绝对路径
 * @param root 相对路径的基准目录 (通常是进程工作目录)
 */
void resolvePatchPaths(Patch& patch, const fs::path& root);

fs::path resolvePatchPath(const fs::path& root, const std::string& patchPath);
