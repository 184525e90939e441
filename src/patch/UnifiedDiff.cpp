#include "patch/UnifiedDiff.h"
#include <algorithm>
#include <optional>
#include <sstream>

namespace {
    // 按行拆分并保留每行的 '\n', 这样 "a" 与 "a\n" 被视为不同的行
    std::vector<std::string> splitKeepNewline(const std::string& content) {
        std::vector<std::string> lines;
        size_t pos = 0;
        while (pos < content.size()) {
            size_t nl = content.find('\n', pos);
            if (nl == std::string::npos) {
                lines.push_back(content.substr(pos));
                break;
            }
            lines.push_back(content.substr(pos, nl - pos + 1));
            pos = nl + 1;
        }
        return lines;
    }

    struct HunkRange {
        size_t start;  // edit 序列下标, 闭区间
        size_t end;
    };

    // 找出所有连续的非 Common 段, 相隔不超过 2*context 的段合并, 再向两边扩展 context 行
    std::vector<HunkRange> composeHunkRanges(const std::vector<Edit>& edits, size_t context) {
        std::vector<HunkRange> ranges;
        for (size_t i = 0; i < edits.size(); ++i) {
            if (edits[i].type == EditType::Common) continue;
            if (!ranges.empty() && i - ranges.back().end <= 2 * context + 1) {
                ranges.back().end = i;
            } else {
                ranges.push_back({i, i});
            }
        }

        for (auto& r : ranges) {
            r.start = r.start > context ? r.start - context : 0;
            r.end = std::min(r.end + context, edits.size() - 1);
        }
        return ranges;
    }

    std::string formatRange(size_t start, size_t count) {
        // GNU 风格: 数量为 1 时省略, 数量为 0 时起始行号取前一行
        if (count == 1) return std::to_string(start + 1);
        if (count == 0) return std::to_string(start) + ",0";
        return std::to_string(start + 1) + "," + std::to_string(count);
    }

    void appendLine(std::ostringstream& out, char op, const std::string& line) {
        out << op;
        if (!line.empty() && line.back() == '\n') {
            out << line;
        } else {
            out << line << "\n\\ No newline at end of file\n";
        }
    }

    struct Point {
        long x;  // A 的行下标
        long y;  // B 的行下标
    };

    struct Box {
        long left;
        long top;
        long right;
        long bottom;

        long width() const { return right - left; }
        long height() const { return bottom - top; }
        long size() const { return width() + height(); }
        long delta() const { return width() - height(); }
    };

    struct Snake {
        Point from;
        Point to;
    };

    /**
     * @brief 线性空间的 Myers 差分: 每次只求中间 snake, 再对两侧子区域递归
     *
     * 每层只保留前向/后向两条 V 数组, 内存为 O(N+M)。
     * 输出的 path 是一串折点, 相邻两点之间至多一次插入或删除。
     */
    class LinearMyers {
    public:
        LinearMyers(const std::vector<std::string>& a, const std::vector<std::string>& b) : a(a), b(b) {}

        bool findPath(const Box& box, std::vector<Point>& out) const {
            std::optional<Snake> snake = midpoint(box);
            if (!snake) return false;

            if (!findPath({box.left, box.top, snake->from.x, snake->from.y}, out)) {
                out.push_back(snake->from);
            }
            if (!findPath({snake->to.x, snake->to.y, box.right, box.bottom}, out)) {
                out.push_back(snake->to);
            }
            return true;
        }

        void walkPath(const std::vector<Point>& path, std::vector<Edit>& edits) const {
            for (size_t i = 0; i + 1 < path.size(); ++i) {
                Point from = path[i];
                const Point to = path[i + 1];

                walkDiagonal(from, to, edits);
                const long xdiff = to.x - from.x;
                const long ydiff = to.y - from.y;
                if (xdiff < ydiff) {
                    edits.push_back({EditType::Insert, 0, static_cast<size_t>(from.y)});
                    ++from.y;
                } else if (xdiff > ydiff) {
                    edits.push_back({EditType::Delete, static_cast<size_t>(from.x), 0});
                    ++from.x;
                }
                walkDiagonal(from, to, edits);
            }
        }

    private:
        const std::vector<std::string>& a;
        const std::vector<std::string>& b;

        void walkDiagonal(Point& from, const Point& to, std::vector<Edit>& edits) const {
            while (from.x < to.x && from.y < to.y && a[from.x] == b[from.y]) {
                edits.push_back({EditType::Common, static_cast<size_t>(from.x), static_cast<size_t>(from.y)});
                ++from.x;
                ++from.y;
            }
        }

        static bool between(long v, long low, long high) { return v >= low && v <= high; }

        std::optional<Snake> midpoint(const Box& box) const {
            if (box.size() == 0) return std::nullopt;

            const long max = 1 + (box.size() - 1) / 2;
            const long offset = max + 1;
            // vf[k]: 前向在对角线 k 上到达的最远 x; vb[c]: 后向在对角线 c 上到达的最小 y
            std::vector<long> vf(static_cast<size_t>(2 * max + 3), 0);
            std::vector<long> vb(static_cast<size_t>(2 * max + 3), 0);
            vf[1 + offset] = box.left;
            vb[1 + offset] = box.bottom;

            for (long d = 0; d <= max; ++d) {
                if (auto snake = forwards(box, vf, vb, offset, d)) return snake;
                if (auto snake = backwards(box, vf, vb, offset, d)) return snake;
            }
            return std::nullopt;
        }

        std::optional<Snake> forwards(const Box& box, std::vector<long>& vf, const std::vector<long>& vb,
                                      long offset, long d) const {
            for (long k = d; k >= -d; k -= 2) {
                const long c = k - box.delta();
                long px = 0;
                long x = 0;
                if (k == -d || (k != d && vf[k - 1 + offset] < vf[k + 1 + offset])) {
                    px = vf[k + 1 + offset];
                    x = px;
                } else {
                    px = vf[k - 1 + offset];
                    x = px + 1;
                }

                long y = box.top + (x - box.left) - k;
                const long py = (d == 0 || x != px) ? y : y - 1;

                while (x < box.right && y < box.bottom && a[x] == b[y]) {
                    ++x;
                    ++y;
                }
                vf[k + offset] = x;

                if (box.delta() % 2 != 0 && between(c, -(d - 1), d - 1) && y >= vb[c + offset]) {
                    return Snake{{px, py}, {x, y}};
                }
            }
            return std::nullopt;
        }

        std::optional<Snake> backwards(const Box& box, const std::vector<long>& vf, std::vector<long>& vb,
                                       long offset, long d) const {
            for (long c = d; c >= -d; c -= 2) {
                const long k = c + box.delta();
                long py = 0;
                long y = 0;
                if (c == -d || (c != d && vb[c - 1 + offset] > vb[c + 1 + offset])) {
                    py = vb[c + 1 + offset];
                    y = py;
                } else {
                    py = vb[c - 1 + offset];
                    y = py - 1;
                }

                long x = box.left + (y - box.top) + k;
                const long px = (d == 0 || y != py) ? x : x + 1;

                while (x > box.left && y > box.top && a[x - 1] == b[y - 1]) {
                    --x;
                    --y;
                }
                vb[c + offset] = y;

                if (box.delta() % 2 == 0 && between(k, -d, d) && x <= vf[k + offset]) {
                    return Snake{{x, y}, {px, py}};
                }
            }
            return std::nullopt;
        }
    };

    // 每段连续改动内部把删除排在插入前面, 输出与 diff -u 一致
    void deletesFirst(std::vector<Edit>& edits) {
        size_t i = 0;
        while (i < edits.size()) {
            if (edits[i].type == EditType::Common) {
                ++i;
                continue;
            }
            size_t j = i;
            while (j < edits.size() && edits[j].type != EditType::Common) ++j;
            std::stable_partition(edits.begin() + i, edits.begin() + j,
                                  [](const Edit& e) { return e.type == EditType::Delete; });
            i = j;
        }
    }
}

std::vector<Edit> myersDiff(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    std::vector<Edit> edits;

    // 公共前缀/后缀直接记为 Common, 只对中间一段做搜索
    size_t prefix = 0;
    while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
           a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]) {
        ++suffix;
    }

    for (size_t i = 0; i < prefix; ++i) {
        edits.push_back({EditType::Common, i, i});
    }

    const long aEnd = static_cast<long>(a.size() - suffix);
    const long bEnd = static_cast<long>(b.size() - suffix);
    const long start = static_cast<long>(prefix);
    if (start == aEnd || start == bEnd) {
        for (long i = start; i < aEnd; ++i) edits.push_back({EditType::Delete, static_cast<size_t>(i), 0});
        for (long j = start; j < bEnd; ++j) edits.push_back({EditType::Insert, 0, static_cast<size_t>(j)});
    } else {
        LinearMyers search(a, b);
        std::vector<Point> path;
        search.findPath({start, start, aEnd, bEnd}, path);
        search.walkPath(path, edits);
    }

    for (size_t i = 0; i < suffix; ++i) {
        edits.push_back({EditType::Common, a.size() - suffix + i, b.size() - suffix + i});
    }

    deletesFirst(edits);
    return edits;
}

std::string unifiedDiff(const std::string& oldName, const std::string& newName,
                        const std::string& oldContent, const std::string& newContent,
                        int contextLines) {
    if (oldContent == newContent) return "";

    const auto a = splitKeepNewline(oldContent);
    const auto b = splitKeepNewline(newContent);
    const auto edits = myersDiff(a, b);
    const size_t context = contextLines > 0 ? static_cast<size_t>(contextLines) : 0;

    // aBefore[i] / bBefore[i]: edits[i] 之前已消耗的 A / B 行数
    std::vector<size_t> aBefore(edits.size() + 1, 0);
    std::vector<size_t> bBefore(edits.size() + 1, 0);
    for (size_t i = 0; i < edits.size(); ++i) {
        aBefore[i + 1] = aBefore[i] + (edits[i].type != EditType::Insert ? 1 : 0);
        bBefore[i + 1] = bBefore[i] + (edits[i].type != EditType::Delete ? 1 : 0);
    }

    std::ostringstream out;
    out << "--- " << oldName << "\n";
    out << "+++ " << newName << "\n";

    for (const auto& range : composeHunkRanges(edits, context)) {
        const size_t aStart = aBefore[range.start];
        const size_t bStart = bBefore[range.start];
        const size_t aCount = aBefore[range.end + 1] - aStart;
        const size_t bCount = bBefore[range.end + 1] - bStart;

        out << "@@ -" << formatRange(aStart, aCount) << " +" << formatRange(bStart, bCount) << " @@\n";
        for (size_t i = range.start; i <= range.end; ++i) {
            const Edit& e = edits[i];
            switch (e.type) {
                case EditType::Common: appendLine(out, ' ', a[e.aIndex]); break;
                case EditType::Delete: appendLine(out, '-', a[e.aIndex]); break;
                case EditType::Insert: appendLine(out, '+', b[e.bIndex]); break;
            }
        }
    }

    return out.str();
}
