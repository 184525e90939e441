#include "patch/ReplacementComposer.h"
#include "patch/SeekSequence.h"
#include <algorithm>

namespace {
    std::string joinLines(const std::vector<std::string>& lines) {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i > 0) out += '\n';
            out += lines[i];
        }
        return out;
    }
}

std::vector<Replacement> computeReplacements(const std::vector<std::string>& lines,
                                             const std::string& path,
                                             const std::vector<UpdateChunk>& chunks) {
    std::vector<Replacement> replacements;
    size_t lineIndex = 0;

    for (const auto& chunk : chunks) {
        if (chunk.changeContext) {
            auto idx = seekSequence(lines, {*chunk.changeContext}, lineIndex, false);
            if (!idx) {
                throw PatchError(PatchError::Kind::ContextNotFound,
                                 "failed to find context '" + *chunk.changeContext + "' in " + path);
            }
            lineIndex = *idx + 1;
        }

        if (chunk.oldLines.empty()) {
            // 纯插入: 追加到文件末尾, 若文件以空行结尾则插在该空行之前
            size_t insertIdx = lines.size();
            if (!lines.empty() && lines.back().empty()) {
                insertIdx = lines.size() - 1;
            }
            replacements.push_back({insertIdx, 0, chunk.newLines});
            continue;
        }

        std::vector<std::string> pattern = chunk.oldLines;
        std::vector<std::string> newSlice = chunk.newLines;

        auto found = seekSequence(lines, pattern, lineIndex, chunk.isEndOfFile);
        if (!found && pattern.back().empty()) {
            pattern.pop_back();
            if (!newSlice.empty() && newSlice.back().empty()) {
                newSlice.pop_back();
            }
            found = seekSequence(lines, pattern, lineIndex, chunk.isEndOfFile);
        }

        if (!found) {
            throw PatchError(PatchError::Kind::ContextNotFound,
                             "failed to find expected lines in " + path + ":\n" + joinLines(chunk.oldLines));
        }

        replacements.push_back({*found, pattern.size(), std::move(newSlice)});
        lineIndex = *found + pattern.size();
    }

    std::stable_sort(replacements.begin(), replacements.end(),
                     [](const Replacement& a, const Replacement& b) { return a.startIndex < b.startIndex; });
    return replacements;
}

std::vector<std::string> applyReplacements(const std::vector<std::string>& lines,
                                           const std::vector<Replacement>& replacements) {
    std::vector<std::string> out = lines;

    for (auto it = replacements.rbegin(); it != replacements.rend(); ++it) {
        const size_t start = std::min(it->startIndex, out.size());
        const size_t end = std::min(start + it->oldLength, out.size());
        out.erase(out.begin() + start, out.begin() + end);
        out.insert(out.begin() + start, it->newLines.begin(), it->newLines.end());
    }

    return out;
}

std::string deriveNewContent(const std::string& oldContent,
                             const std::string& path,
                             const std::vector<UpdateChunk>& chunks) {
    std::vector<std::string> originalLines;
    size_t pos = 0;
    while (true) {
        size_t nl = oldContent.find('\n', pos);
        if (nl == std::string::npos) {
            originalLines.push_back(oldContent.substr(pos));
            break;
        }
        originalLines.push_back(oldContent.substr(pos, nl - pos));
        pos = nl + 1;
    }
    // "a\nb\n" 拆出来最后是一个空元素, 它只代表结尾换行
    if (!originalLines.empty() && originalLines.back().empty()) {
        originalLines.pop_back();
    }

    auto replacements = computeReplacements(originalLines, path, chunks);
    auto updated = applyReplacements(originalLines, replacements);
    if (updated.empty() || !updated.back().empty()) {
        updated.emplace_back();
    }
    return joinLines(updated);
}
