#include "state/FileState.h"

void BasicFileState::lockFile(const std::string& path) {
    std::mutex* lock = nullptr;
    {
        std::lock_guard<std::mutex> guard(fileLocksMtx);
        auto& slot = fileLocks[path];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        lock = slot.get();
    }
    lock->lock();
}

void BasicFileState::unlockFile(const std::string& path) {
    std::mutex* lock = nullptr;
    {
        std::lock_guard<std::mutex> guard(fileLocksMtx);
        auto it = fileLocks.find(path);
        if (it == fileLocks.end()) {
            return;
        }
        lock = it->second.get();
    }
    lock->unlock();
}

void BasicFileState::setFileLastAccessed(const std::string& path, TimePoint when) {
    std::unique_lock<std::shared_mutex> lock(accessMtx);
    lastAccessed[path] = when;
}

void BasicFileState::clearFileLastAccessed(const std::string& path) {
    std::unique_lock<std::shared_mutex> lock(accessMtx);
    lastAccessed.erase(path);
}

std::optional<IFileState::TimePoint> BasicFileState::getFileLastAccessed(const std::string& path) const {
    std::shared_lock<std::shared_mutex> lock(accessMtx);
    auto it = lastAccessed.find(path);
    if (it == lastAccessed.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, IFileState::TimePoint> BasicFileState::fileLastAccess() const {
    std::shared_lock<std::shared_mutex> lock(accessMtx);
    return lastAccessed;
}
