#include "patch/SeekSequence.h"
#include "utils/Logger.h"
#include "utils/UTF8Utils.h"
#include <functional>

namespace {
    const char* const kWhitespace = " \t\n\v\f\r";

    using LineEquals = std::function<bool(const std::string&, const std::string&)>;

    // 在 [first, last] 范围内找第一个整段匹配的位置
    std::optional<size_t> scanWindow(const std::vector<std::string>& lines,
                                     const std::vector<std::string>& pattern,
                                     size_t first, size_t last,
                                     const LineEquals& equals) {
        for (size_t i = first; i <= last; ++i) {
            bool match = true;
            for (size_t j = 0; j < pattern.size(); ++j) {
                if (!equals(lines[i + j], pattern[j])) {
                    match = false;
                    break;
                }
            }
            if (match) return i;
        }
        return std::nullopt;
    }

    long mapTypographic(long cp) {
        switch (cp) {
            // dashes
            case 0x2010: case 0x2011: case 0x2012: case 0x2013:
            case 0x2014: case 0x2015: case 0x2212:
                return '-';
            // single quotes
            case 0x2018: case 0x2019: case 0x201A: case 0x201B:
                return '\'';
            // double quotes
            case 0x201C: case 0x201D: case 0x201E: case 0x201F:
                return '"';
            // NEL, NBSP, en/em spaces, line/paragraph separators and friends
            case 0x0085: case 0x00A0: case 0x1680:
            case 0x2000: case 0x2001: case 0x2002: case 0x2003: case 0x2004: case 0x2005:
            case 0x2006: case 0x2007: case 0x2008: case 0x2009: case 0x200A:
            case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
                return ' ';
            default:
                return cp;
        }
    }
}

std::string trimRight(const std::string& s, const char* chars) {
    size_t end = s.find_last_not_of(chars);
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string trimSpace(const std::string& s) {
    size_t begin = s.find_first_not_of(kWhitespace);
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(kWhitespace);
    return s.substr(begin, end - begin + 1);
}

std::string normalizeSearchLine(const std::string& line) {
    std::string mapped;
    mapped.reserve(line.size());

    size_t i = 0;
    while (i < line.size()) {
        size_t len = 1;
        long cp = UTF8Utils::decodeAt(line, i, len);
        if (cp < 0) {
            // 非法字节原样保留, 两侧按同样规则处理即可
            mapped.push_back(line[i]);
        } else {
            UTF8Utils::appendCodePoint(mapped, mapTypographic(cp));
        }
        i += len;
    }

    // 先映射再裁剪, 这样行首尾的 NBSP 也会被去掉
    return trimSpace(mapped);
}

std::optional<size_t> seekSequence(const std::vector<std::string>& lines,
                                   const std::vector<std::string>& pattern,
                                   size_t start,
                                   bool eof) {
    if (pattern.empty()) return start;
    if (pattern.size() > lines.size()) return std::nullopt;

    const size_t lastStart = lines.size() - pattern.size();
    const size_t searchStart = eof ? lastStart : start;
    if (searchStart > lastStart) return std::nullopt;

    static const LineEquals tiers[] = {
        [](const std::string& a, const std::string& b) { return a == b; },
        [](const std::string& a, const std::string& b) { return trimRight(a) == trimRight(b); },
        [](const std::string& a, const std::string& b) { return trimSpace(a) == trimSpace(b); },
        [](const std::string& a, const std::string& b) { return normalizeSearchLine(a) == normalizeSearchLine(b); },
    };

    for (size_t tier = 0; tier < sizeof(tiers) / sizeof(tiers[0]); ++tier) {
        auto found = scanWindow(lines, pattern, searchStart, lastStart, tiers[tier]);
        if (found) {
            if (tier > 0) {
                Logger::getInstance().debug("seekSequence: matched at line " + std::to_string(*found + 1) +
                                            " using fuzzy tier " + std::to_string(tier + 1));
            }
            return found;
        }
    }

    return std::nullopt;
}
