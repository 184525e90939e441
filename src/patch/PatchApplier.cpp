#include "patch/PatchApplier.h"
#include "patch/ReplacementComposer.h"
#include "patch/UnifiedDiff.h"
#include "state/PathLock.h"
#include "utils/Logger.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {
    std::string osError() {
        return errno != 0 ? std::strerror(errno) : "unknown error";
    }

    std::string readFileContent(const std::string& path, const std::string& what) {
        errno = 0;
        std::ifstream in(fs::u8path(path), std::ios::binary);
        if (!in.is_open()) {
            throw PatchError(PatchError::Kind::Io, what + " " + path + ": " + osError());
        }
        std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in.bad()) {
            throw PatchError(PatchError::Kind::Io, what + " " + path + ": " + osError());
        }
        return content;
    }

    void writeFileContent(const std::string& path, const std::string& content) {
        errno = 0;
        std::ofstream out(fs::u8path(path), std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw PatchError(PatchError::Kind::Io, "failed to write file " + path + ": " + osError());
        }
        out << content;
        out.flush();
        if (!out) {
            throw PatchError(PatchError::Kind::Io, "failed to write file " + path + ": " + osError());
        }
    }

    void ensureParentDirectories(const std::string& path) {
        fs::path parent = fs::u8path(path).parent_path();
        if (parent.empty()) return;
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw PatchError(PatchError::Kind::Io,
                             "failed to create parent directories for " + path + ": " + ec.message());
        }
    }

    void removeFile(const std::string& path, const std::string& what) {
        std::error_code ec;
        if (!fs::remove(fs::u8path(path), ec) || ec) {
            throw PatchError(PatchError::Kind::Io,
                             what + " " + path + ": " + (ec ? ec.message() : "No such file or directory"));
        }
    }

    void checkExistingFile(const std::string& path, const std::string& verb) {
        std::error_code ec;
        fs::file_status st = fs::status(fs::u8path(path), ec);
        if (ec || !fs::exists(st)) {
            throw PatchError(PatchError::Kind::Precondition,
                             "failed to stat " + path + ": " + (ec ? ec.message() : "No such file or directory"));
        }
        if (fs::is_directory(st)) {
            throw PatchError(PatchError::Kind::Precondition,
                             "failed to " + verb + " file " + path + ": is a directory");
        }
    }

    // 一个 hunk 涉及的路径集合 (更新 + 移动时包含目标路径)
    std::vector<std::string> hunkPaths(const Hunk& hunk) {
        std::vector<std::string> paths{hunk.path};
        if (hunk.kind == HunkKind::Update && !hunk.movePath.empty()) {
            paths.push_back(hunk.movePath);
        }
        return paths;
    }
}

PatchApplier::PatchApplier(IFileState& state, int diffContextLines)
    : state(state), diffContextLines(diffContextLines) {}

void PatchApplier::validate(const Patch& patch) const {
    for (const auto& hunk : patch.hunks) {
        switch (hunk.kind) {
            case HunkKind::Add:
                break;
            case HunkKind::Delete:
                checkExistingFile(hunk.path, "delete");
                break;
            case HunkKind::Update:
                checkExistingFile(hunk.path, "update");
                break;
        }
    }
}

void PatchApplier::dryRun(const Patch& patch) const {
    validate(patch);
    for (const auto& hunk : patch.hunks) {
        if (hunk.kind != HunkKind::Update) continue;
        auto guard = lockPaths(state, hunkPaths(hunk));
        const std::string oldContent = readFileContent(hunk.path, "failed to read file to update");
        deriveNewContent(oldContent, hunk.path, hunk.chunks);
    }
}

ApplyPatchResult PatchApplier::apply(const Patch& patch) {
    ApplyPatchResult result;
    if (patch.hunks.empty()) {
        result.error = "No files were modified.";
        return result;
    }

    for (const auto& hunk : patch.hunks) {
        try {
            auto guard = lockPaths(state, hunkPaths(hunk));
            switch (hunk.kind) {
                case HunkKind::Add:
                    applyAdd(hunk, result);
                    break;
                case HunkKind::Delete:
                    applyDelete(hunk, result);
                    break;
                case HunkKind::Update:
                    applyUpdate(hunk, result);
                    break;
            }
        } catch (const std::exception& e) {
            // 已应用的 hunk 保持原样, 剩余 hunk 不再执行
            Logger::getInstance().error("apply_patch: " + std::string(e.what()));
            result.error = e.what();
            return result;
        }
    }

    return result;
}

void PatchApplier::applyAdd(const Hunk& hunk, ApplyPatchResult& result) {
    Logger::getInstance().action("Add " + hunk.path);
    ensureParentDirectories(hunk.path);
    writeFileContent(hunk.path, hunk.contents);
    state.setFileLastAccessed(hunk.path, std::chrono::system_clock::now());

    result.added.push_back(hunk.path);
    FileChange change;
    change.path = hunk.path;
    change.operation = ChangeOperation::Add;
    change.newContent = hunk.contents;
    result.changes.push_back(std::move(change));
    Logger::getInstance().success("A " + hunk.path);
}

void PatchApplier::applyDelete(const Hunk& hunk, ApplyPatchResult& result) {
    Logger::getInstance().action("Delete " + hunk.path);
    std::string oldContent = readFileContent(hunk.path, "failed to read");
    removeFile(hunk.path, "failed to delete file");
    state.clearFileLastAccessed(hunk.path);

    result.deleted.push_back(hunk.path);
    FileChange change;
    change.path = hunk.path;
    change.operation = ChangeOperation::Delete;
    change.oldContent = std::move(oldContent);
    result.changes.push_back(std::move(change));
    Logger::getInstance().success("D " + hunk.path);
}

void PatchApplier::applyUpdate(const Hunk& hunk, ApplyPatchResult& result) {
    Logger::getInstance().action("Update " + hunk.path + " (" + std::to_string(hunk.chunks.size()) + " chunk(s))");
    const std::string oldContent = readFileContent(hunk.path, "failed to read file to update");
    const std::string newContent = deriveNewContent(oldContent, hunk.path, hunk.chunks);

    const std::string targetPath = hunk.movePath.empty() ? hunk.path : hunk.movePath;

    // 变更记录和 diff 在写盘前生成
    FileChange change;
    change.path = hunk.path;
    change.operation = ChangeOperation::Update;
    change.oldContent = oldContent;
    change.newContent = newContent;
    change.unifiedDiff = unifiedDiff(hunk.path, targetPath, oldContent, newContent, diffContextLines);
    change.movePath = hunk.movePath;

    if (!hunk.movePath.empty()) {
        ensureParentDirectories(hunk.movePath);
        writeFileContent(hunk.movePath, newContent);
        // Move onto itself: writing in place is all there is to do
        if (hunk.movePath != hunk.path) {
            removeFile(hunk.path, "failed to remove original");
            state.clearFileLastAccessed(hunk.path);
        }
    } else {
        writeFileContent(hunk.path, newContent);
    }
    state.setFileLastAccessed(targetPath, std::chrono::system_clock::now());

    result.modified.push_back(targetPath);
    result.changes.push_back(std::move(change));
    Logger::getInstance().success("M " + targetPath);
}
