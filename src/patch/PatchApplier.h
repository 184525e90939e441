#pragma once
#include "patch/PatchTypes.h"
#include "state/FileState.h"

/**
 * @brief 把解析好的补丁落到文件系统
 *
 * 每个 hunk 独立加锁 (lockPaths), 执行完立即释放。任意 hunk 失败即停止,
 * 之前已应用的 hunk 不回滚; 失败原因写入 ApplyPatchResult::error。
 *
 * 传入的 Patch 必须已经过 resolvePatchPaths (路径为绝对路径)。
 */
class PatchApplier {
public:
    explicit PatchApplier(IFileState& state, int diffContextLines = 3);

    /**
     * @brief 前置条件检查: Delete / Update 的目标必须存在且不是目录
     * @throws PatchError(Precondition)
     */
    void validate(const Patch& patch) const;

    /**
     * @brief 只校验不写入: 前置条件 + 每个 Update hunk 的上下文都能定位
     * @throws PatchError
     */
    void dryRun(const Patch& patch) const;

    ApplyPatchResult apply(const Patch& patch);

private:
    IFileState& state;
    int diffContextLines;

    void applyAdd(const Hunk& hunk, ApplyPatchResult& result);
    void applyDelete(const Hunk& hunk, ApplyPatchResult& result);
    void applyUpdate(const Hunk& hunk, ApplyPatchResult& result);
};
