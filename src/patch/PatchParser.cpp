#include "patch/PatchParser.h"
#include "patch/SeekSequence.h"

namespace {
    bool startsWith(const std::string& s, const std::string& prefix) {
        return s.rfind(prefix, 0) == 0;
    }

    bool endsWith(const std::string& s, const std::string& suffix) {
        return s.size() >= suffix.size() &&
               s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        size_t pos = 0;
        while (true) {
            size_t nl = text.find('\n', pos);
            std::string line = text.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            lines.push_back(std::move(line));
            if (nl == std::string::npos) break;
            pos = nl + 1;
        }
        return lines;
    }

    // 严格边界检查; 返回空串表示通过, 否则为缺失边界的描述
    std::string checkBoundariesStrict(const std::vector<std::string>& lines) {
        if (lines.empty() || trimSpace(lines.front()) != PatchMarkers::kBeginPatch) {
            return std::string("The first line of the patch must be '") + PatchMarkers::kBeginPatch + "'";
        }
        if (lines.size() < 2 || trimSpace(lines.back()) != PatchMarkers::kEndPatch) {
            return std::string("The last line of the patch must be '") + PatchMarkers::kEndPatch + "'";
        }
        return "";
    }

    bool isHeredocWrapped(const std::vector<std::string>& lines) {
        if (lines.size() < 4) return false;
        const std::string first = trimSpace(lines.front());
        const std::string last = trimSpace(lines.back());
        return (first == "<<EOF" || first == "<<'EOF'" || first == "<<\"EOF\"") && endsWith(last, "EOF");
    }

    Hunk parseOneHunk(const std::vector<std::string>& lines, size_t begin, size_t lineNumber, size_t& consumed) {
        const std::string firstLine = trimSpace(lines[begin]);

        if (startsWith(firstLine, PatchMarkers::kAddFile)) {
            Hunk hunk;
            hunk.kind = HunkKind::Add;
            hunk.path = firstLine.substr(std::string(PatchMarkers::kAddFile).size());
            consumed = 1;
            for (size_t i = begin + 1; i < lines.size() && startsWith(lines[i], "+"); ++i) {
                hunk.contents += lines[i].substr(1);
                hunk.contents += '\n';
                ++consumed;
            }
            return hunk;
        }

        if (startsWith(firstLine, PatchMarkers::kDeleteFile)) {
            Hunk hunk;
            hunk.kind = HunkKind::Delete;
            hunk.path = firstLine.substr(std::string(PatchMarkers::kDeleteFile).size());
            consumed = 1;
            return hunk;
        }

        if (startsWith(firstLine, PatchMarkers::kUpdateFile)) {
            Hunk hunk;
            hunk.kind = HunkKind::Update;
            hunk.path = firstLine.substr(std::string(PatchMarkers::kUpdateFile).size());
            consumed = 1;

            size_t i = begin + 1;
            if (i < lines.size()) {
                const std::string moveLine = trimSpace(lines[i]);
                if (startsWith(moveLine, PatchMarkers::kMoveTo)) {
                    hunk.movePath = moveLine.substr(std::string(PatchMarkers::kMoveTo).size());
                    ++i;
                    ++consumed;
                }
            }

            while (i < lines.size()) {
                if (trimSpace(lines[i]).empty()) {
                    ++i;
                    ++consumed;
                    continue;
                }
                if (startsWith(lines[i], "***")) {
                    break;
                }

                size_t chunkConsumed = 0;
                hunk.chunks.push_back(parseUpdateChunk(lines, i, lineNumber + consumed,
                                                       hunk.chunks.empty(), chunkConsumed));
                i += chunkConsumed;
                consumed += chunkConsumed;
            }

            if (hunk.chunks.empty()) {
                throw PatchError(PatchError::Kind::EmptyUpdateHunk,
                                 "invalid hunk at line " + std::to_string(lineNumber) +
                                     ", Update file hunk for path '" + hunk.path + "' is empty",
                                 lineNumber);
            }
            return hunk;
        }

        throw PatchError(PatchError::Kind::InvalidHunkHeader,
                         "invalid hunk at line " + std::to_string(lineNumber) + ", '" + firstLine +
                             "' is not a valid hunk header. Valid hunk headers: '*** Add File: {path}', "
                             "'*** Delete File: {path}', '*** Update File: {path}'",
                         lineNumber);
    }
}

ChunkLine classifyChunkLine(const std::string& line) {
    if (trimSpace(line) == PatchMarkers::kEndOfFile) return ChunkLine::EndOfFile;
    if (line.empty()) return ChunkLine::Blank;
    switch (line[0]) {
        case ' ': return ChunkLine::Context;
        case '+': return ChunkLine::Addition;
        case '-': return ChunkLine::Removal;
        default: return ChunkLine::Other;
    }
}

std::vector<std::string> normalizePatchBoundaries(const std::vector<std::string>& lines) {
    const std::string strictError = checkBoundariesStrict(lines);
    if (strictError.empty()) {
        return lines;
    }

    if (!isHeredocWrapped(lines)) {
        throw PatchError(PatchError::Kind::MalformedPatch, "invalid patch: " + strictError);
    }

    std::vector<std::string> inner(lines.begin() + 1, lines.end() - 1);
    const std::string innerError = checkBoundariesStrict(inner);
    if (!innerError.empty()) {
        throw PatchError(PatchError::Kind::MalformedPatch, "invalid patch: " + innerError);
    }
    return inner;
}

UpdateChunk parseUpdateChunk(const std::vector<std::string>& lines, size_t begin, size_t lineNumber,
                             bool allowMissingContext, size_t& consumed) {
    if (begin >= lines.size()) {
        throw PatchError(PatchError::Kind::EmptyChunk,
                         "invalid hunk at line " + std::to_string(lineNumber) +
                             ", Update hunk does not contain any lines",
                         lineNumber);
    }

    UpdateChunk chunk;
    size_t start = 0;
    const std::string firstTrimmed = trimSpace(lines[begin]);
    if (firstTrimmed == PatchMarkers::kEmptyChangeContext) {
        start = 1;
    } else if (startsWith(firstTrimmed, PatchMarkers::kChangeContext)) {
        chunk.changeContext = firstTrimmed.substr(std::string(PatchMarkers::kChangeContext).size());
        start = 1;
    } else if (!allowMissingContext) {
        throw PatchError(PatchError::Kind::MissingContextMarker,
                         "invalid hunk at line " + std::to_string(lineNumber) +
                             ", Expected update hunk to start with a @@ context marker, got: '" +
                             lines[begin] + "'",
                         lineNumber);
    }

    if (begin + start >= lines.size()) {
        throw PatchError(PatchError::Kind::EmptyChunk,
                         "invalid hunk at line " + std::to_string(lineNumber + 1) +
                             ", Update hunk does not contain any lines",
                         lineNumber + 1);
    }

    size_t parsed = 0;
    for (size_t i = begin + start; i < lines.size(); ++i) {
        const std::string& line = lines[i];
        const size_t currentLine = lineNumber + (i - begin);
        bool done = false;

        switch (classifyChunkLine(line)) {
            case ChunkLine::EndOfFile:
                if (parsed == 0) {
                    throw PatchError(PatchError::Kind::EmptyChunk,
                                     "invalid hunk at line " + std::to_string(currentLine) +
                                         ", Update hunk does not contain any lines",
                                     currentLine);
                }
                chunk.isEndOfFile = true;
                ++parsed;
                done = true;
                break;
            case ChunkLine::Blank:
                chunk.oldLines.emplace_back();
                chunk.newLines.emplace_back();
                ++parsed;
                break;
            case ChunkLine::Context:
                chunk.oldLines.push_back(line.substr(1));
                chunk.newLines.push_back(line.substr(1));
                ++parsed;
                break;
            case ChunkLine::Addition:
                chunk.newLines.push_back(line.substr(1));
                ++parsed;
                break;
            case ChunkLine::Removal:
                chunk.oldLines.push_back(line.substr(1));
                ++parsed;
                break;
            case ChunkLine::Other:
                if (parsed == 0) {
                    throw PatchError(PatchError::Kind::UnexpectedLine,
                                     "invalid hunk at line " + std::to_string(currentLine) +
                                         ", Unexpected line found in update hunk: '" + line +
                                         "'. Every line should start with ' ' (context line), "
                                         "'+' (added line), or '-' (removed line)",
                                     currentLine);
                }
                done = true;
                break;
        }
        if (done) break;
    }

    consumed = start + parsed;
    return chunk;
}

Patch parsePatch(const std::string& text) {
    const std::string trimmed = trimSpace(text);
    if (trimmed.empty()) {
        throw PatchError(PatchError::Kind::MalformedPatch, "invalid patch: empty patch");
    }

    const std::vector<std::string> lines = normalizePatchBoundaries(splitLines(trimmed));

    // 去掉 Begin / End 两行; 第一个 hunk 头位于第 2 行
    const std::vector<std::string> body(lines.begin() + 1, lines.end() - 1);

    Patch patch;
    size_t index = 0;
    while (index < body.size()) {
        size_t consumed = 0;
        patch.hunks.push_back(parseOneHunk(body, index, index + 2, consumed));
        index += consumed;
    }
    return patch;
}

fs::path resolvePatchPath(const fs::path& root, const std::string& patchPath) {
    fs::path p = fs::u8path(patchPath);
    if (!p.is_absolute()) {
        p = root / p;
    }
    p = p.lexically_normal();
    // lexically_normal 保留结尾分隔符 ("dir/"), 统一去掉
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

void resolvePatchPaths(Patch& patch, const fs::path& root) {
    for (auto& hunk : patch.hunks) {
        hunk.path = resolvePatchPath(root, hunk.path).u8string();
        if (!hunk.movePath.empty()) {
            hunk.movePath = resolvePatchPath(root, hunk.movePath).u8string();
        }
    }
}
