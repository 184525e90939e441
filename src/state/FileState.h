#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

/**
 * @brief 工具调用之间共享的文件状态
 *
 * - 路径锁: 每个绝对路径一把互斥锁, 串行化对同一文件的修改
 * - 最近访问时间: 供 "读取后文件是否被改过" 的检查使用, apply_patch 修改文件后同步更新
 *
 * 加锁只能通过 lockPaths (state/PathLock.h), 不要在工具里直接调用 lockFile。
 */
class IFileState {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~IFileState() = default;

    virtual void lockFile(const std::string& path) = 0;
    virtual void unlockFile(const std::string& path) = 0;

    virtual void setFileLastAccessed(const std::string& path, TimePoint when) = 0;
    virtual void clearFileLastAccessed(const std::string& path) = 0;

    /**
     * @return 最近访问时间; 该文件从未被读取过时返回 std::nullopt
     */
    virtual std::optional<TimePoint> getFileLastAccessed(const std::string& path) const = 0;
};

/**
 * @brief 进程内默认实现
 */
class BasicFileState : public IFileState {
public:
    BasicFileState() = default;

    void lockFile(const std::string& path) override;
    void unlockFile(const std::string& path) override;

    void setFileLastAccessed(const std::string& path, TimePoint when) override;
    void clearFileLastAccessed(const std::string& path) override;
    std::optional<TimePoint> getFileLastAccessed(const std::string& path) const override;

    // 整张访问时间表的快照
    std::map<std::string, TimePoint> fileLastAccess() const;

private:
    // 锁对象创建后不再移除, 地址在进程生命周期内稳定
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> fileLocks;
    std::mutex fileLocksMtx;

    std::map<std::string, TimePoint> lastAccessed;
    mutable std::shared_mutex accessMtx;
};
