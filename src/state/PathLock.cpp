#include "state/PathLock.h"
#include <algorithm>

PathLockGuard::PathLockGuard(IFileState& state, std::vector<std::string> orderedPaths)
    : state(&state) {
    lockedPaths.reserve(orderedPaths.size());
    try {
        for (auto& path : orderedPaths) {
            state.lockFile(path);
            lockedPaths.push_back(std::move(path));
        }
    } catch (...) {
        // 析构函数不会为构造失败的对象运行, 这里释放已拿到的锁后继续抛出
        for (auto it = lockedPaths.rbegin(); it != lockedPaths.rend(); ++it) {
            state.unlockFile(*it);
        }
        throw;
    }
}

PathLockGuard::PathLockGuard(PathLockGuard&& other) noexcept
    : state(other.state), lockedPaths(std::move(other.lockedPaths)) {
    other.lockedPaths.clear();
}

PathLockGuard::~PathLockGuard() {
    for (auto it = lockedPaths.rbegin(); it != lockedPaths.rend(); ++it) {
        state->unlockFile(*it);
    }
}

PathLockGuard lockPaths(IFileState& state, std::vector<std::string> paths) {
    paths.erase(std::remove_if(paths.begin(), paths.end(),
                               [](const std::string& p) { return p.empty(); }),
                paths.end());
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return PathLockGuard(state, std::move(paths));
}
