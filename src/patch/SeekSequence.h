#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief 在文件行中模糊定位一段期望的行序列
 *
 * 依次尝试四级匹配, 每一级扫描完整个窗口后才进入下一级:
 *   1. 完全相等
 *   2. 去掉行尾空格/制表符后相等
 *   3. 去掉首尾空白后相等
 *   4. Unicode 标点归一化后相等 (破折号、弯引号、特殊空格)
 *
 * @param lines 文件当前内容 (按行)
 * @param pattern 期望存在的行序列; 为空时直接返回 start
 * @param start 搜索起点
 * @param eof 为 true 时只尝试文件尾部这一个位置
 * @return 匹配的起始下标; 找不到返回 std::nullopt
 */
std::optional<size_t> seekSequence(const std::vector<std::string>& lines,
                                   const std::vector<std::string>& pattern,
                                   size_t start,
                                   bool eof);

/**
 * @brief 第四级匹配使用的归一化: 映射排版标点后去掉首尾空白
 */
std::string normalizeSearchLine(const std::string& line);

std::string trimRight(const std::string& s, const char* chars = " \t");
std::string trimSpace(const std::string& s);
