#pragma once
#include "patch/PatchTypes.h"
#include <string>
#include <vector>

/**
 * @brief 依次定位每个 chunk, 生成针对原始行数组的 Replacement 列表
 *
 * 维护一个单调前进的游标: @@ 锚点命中后游标移到锚点下一行, 旧行命中后移到命中段末尾。
 * 旧行找不到且末尾是空行时, 去掉该空行 (新行同步去掉) 再试一次。
 * 只在游标之后查找, chunk 必须按文件顺序排列。
 *
 * @param lines 文件原始行 (不含最后换行符之后的空元素)
 * @param path 用于错误信息
 * @return 按 startIndex 升序排列
 * @throws PatchError(ContextNotFound)
 */
std::vector<Replacement> computeReplacements(const std::vector<std::string>& lines,
                                             const std::string& path,
                                             const std::vector<UpdateChunk>& chunks);

/**
 * @brief 从最后一个 Replacement 往前应用, 保证前面的下标不失效
 */
std::vector<std::string> applyReplacements(const std::vector<std::string>& lines,
                                           const std::vector<Replacement>& replacements);

/**
 * @brief 对整份文件内容应用 chunks, 结果总以一个换行结尾
 */
std::string deriveNewContent(const std::string& oldContent,
                             const std::string& path,
                             const std::vector<UpdateChunk>& chunks);
