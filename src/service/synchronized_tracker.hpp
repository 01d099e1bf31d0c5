#pragma once

#include "tracker_service.hpp"

#include <mutex>
#include <utility>

namespace trk::service
{

// 给 TrackerService 加一把粗粒度锁：
// 每次 withLock 调用都是一个完整的临界区，assignIssue 这类“设置 assignee + 修改状态”的复合操作
// 不会与其他线程的修改交错。
// 注意：fn 不应把内部实体的指针/引用带出临界区，需要的话返回值拷贝。
class SynchronizedTracker
{
public:
    SynchronizedTracker() = default;

    SynchronizedTracker(const SynchronizedTracker&) = delete;
    SynchronizedTracker& operator=(const SynchronizedTracker&) = delete;

    template <typename Fn>
    decltype(auto) withLock(Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(tracker_);
    }

    template <typename Fn>
    decltype(auto) withLock(Fn&& fn) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::forward<Fn>(fn)(tracker_);
    }

private:
    TrackerService     tracker_;
    mutable std::mutex mutex_;
};

} // namespace trk::service
