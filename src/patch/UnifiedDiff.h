#pragma once
#include <cstddef>
#include <string>
#include <vector>

/**
 * @brief 行级编辑序列 (把 A 变成 B)
 */
enum class EditType {
    Common,
    Delete,
    Insert
};

struct Edit {
    EditType type;
    size_t aIndex;  // Delete / Common 有效
    size_t bIndex;  // Insert / Common 有效
};

/**
 * @brief 线性空间的 Myers 差分算法, 时间 O((N+M)D), 内存 O(N+M)
 *
 * 结果是最短编辑序列; 每段连续改动中删除排在插入之前。
 */
std::vector<Edit> myersDiff(const std::vector<std::string>& a, const std::vector<std::string>& b);

/**
 * @brief 生成 unified diff 文本
 *
 * 内容相同返回空串。最后一行没有换行时追加 "\ No newline at end of file"。
 */
std::string unifiedDiff(const std::string& oldName, const std::string& newName,
                        const std::string& oldContent, const std::string& newContent,
                        int contextLines = 3);
