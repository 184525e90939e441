#pragma once
#include <cstddef>
#include <string>

// UTF-8 辅助函数
namespace UTF8Utils {
    /**
     * @brief 验证并清理 UTF-8 字符串，替换无效字节为 '?'
     *
     * nlohmann::json::dump 遇到非法 UTF-8 会抛异常，写入 JSON 结果前必须先清理。
     */
    std::string sanitize(const std::string& input);

    /**
     * @brief 从 pos 处解码一个码点
     * @param len 输出: 本码点占用的字节数 (至少为 1)
     * @return 码点; 无效序列返回 -1 且 len = 1
     */
    long decodeAt(const std::string& input, size_t pos, size_t& len);

    // 追加码点的 UTF-8 编码
    void appendCodePoint(std::string& out, long cp);
}
