#pragma once
#include "state/FileState.h"
#include <string>
#include <vector>

/**
 * @brief 一组路径锁的 RAII 持有者
 *
 * 析构时按加锁的逆序释放。只能移动, 不能复制。
 */
class PathLockGuard {
public:
    PathLockGuard(IFileState& state, std::vector<std::string> orderedPaths);
    ~PathLockGuard();

    PathLockGuard(PathLockGuard&& other) noexcept;
    PathLockGuard(const PathLockGuard&) = delete;
    PathLockGuard& operator=(const PathLockGuard&) = delete;
    PathLockGuard& operator=(PathLockGuard&&) = delete;

    // 已加锁的路径 (加锁顺序)
    const std::vector<std::string>& paths() const { return lockedPaths; }

private:
    IFileState* state;
    std::vector<std::string> lockedPaths;
};

/**
 * @brief 对一个 hunk 涉及的所有路径加锁
 *
 * 去掉空串和重复项后按字典序加锁。所有调用方都用同一个全局顺序, 两个补丁以不同顺序
 * 触碰同一组文件时也不会死锁。这是获取文件锁的唯一入口。
 */
PathLockGuard lockPaths(IFileState& state, std::vector<std::string> paths);
