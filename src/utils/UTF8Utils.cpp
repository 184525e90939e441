#include "utils/UTF8Utils.h"

namespace UTF8Utils {
    namespace {
        bool isContinuation(unsigned char c) {
            return (c & 0xC0) == 0x80;
        }

        // 返回合法序列长度, 0 表示从 pos 起不是一个完整合法的序列
        size_t validSequenceLength(const std::string& input, size_t i) {
            unsigned char c = static_cast<unsigned char>(input[i]);
            if (c <= 0x7F) return 1;

            // 2 字节序列 (0xC2-0xDF) - 注意: 0xC0-0xC1 是无效的
            if (c >= 0xC2 && c <= 0xDF) {
                if (i + 1 < input.size() && isContinuation(static_cast<unsigned char>(input[i + 1]))) {
                    return 2;
                }
                return 0;
            }

            // 3 字节序列 (0xE0-0xEF)
            if (c >= 0xE0 && c <= 0xEF) {
                if (i + 2 >= input.size()) return 0;
                unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                unsigned char c2 = static_cast<unsigned char>(input[i + 2]);
                if (!isContinuation(c1) || !isContinuation(c2)) return 0;
                // 避免过长编码和代理区
                if (c == 0xE0 && c1 < 0xA0) return 0;
                if (c == 0xED && c1 > 0x9F) return 0;
                return 3;
            }

            // 4 字节序列 (0xF0-0xF4)
            if (c >= 0xF0 && c <= 0xF4) {
                if (i + 3 >= input.size()) return 0;
                unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
                unsigned char c2 = static_cast<unsigned char>(input[i + 2]);
                unsigned char c3 = static_cast<unsigned char>(input[i + 3]);
                if (!isContinuation(c1) || !isContinuation(c2) || !isContinuation(c3)) return 0;
                // 避免过长编码和超出 Unicode 范围
                if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) return 0;
                return 4;
            }

            return 0;
        }
    }

    std::string sanitize(const std::string& input) {
        std::string output;
        output.reserve(input.size());

        size_t i = 0;
        while (i < input.size()) {
            size_t n = validSequenceLength(input, i);
            if (n > 0) {
                output.append(input, i, n);
                i += n;
                continue;
            }
            unsigned char c = static_cast<unsigned char>(input[i]);
            // 孤立的续字节直接跳过, 其余无效起始字节替换为 '?'
            if (!isContinuation(c)) {
                output.push_back('?');
            }
            i++;
        }

        return output;
    }

    long decodeAt(const std::string& input, size_t pos, size_t& len) {
        len = 1;
        size_t n = validSequenceLength(input, pos);
        unsigned char c = static_cast<unsigned char>(input[pos]);
        switch (n) {
            case 1:
                return c;
            case 2:
                len = 2;
                return (static_cast<long>(c & 0x1F) << 6) |
                       (static_cast<unsigned char>(input[pos + 1]) & 0x3F);
            case 3:
                len = 3;
                return (static_cast<long>(c & 0x0F) << 12) |
                       (static_cast<long>(static_cast<unsigned char>(input[pos + 1]) & 0x3F) << 6) |
                       (static_cast<unsigned char>(input[pos + 2]) & 0x3F);
            case 4:
                len = 4;
                return (static_cast<long>(c & 0x07) << 18) |
                       (static_cast<long>(static_cast<unsigned char>(input[pos + 1]) & 0x3F) << 12) |
                       (static_cast<long>(static_cast<unsigned char>(input[pos + 2]) & 0x3F) << 6) |
                       (static_cast<unsigned char>(input[pos + 3]) & 0x3F);
            default:
                return -1;
        }
    }

    void appendCodePoint(std::string& out, long cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
}
