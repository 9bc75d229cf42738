#pragma once

#include "edgelog/common/noncopyable.h"
#include <mutex>
#include <condition_variable>
#include <thread>
#include <string>

namespace edgelog {
namespace network {

class EventLoop;

class EventLoopThread : edgelog::common::noncopyable {
public:
    explicit EventLoopThread(const std::string& name = std::string());
    ~EventLoopThread();

    // Starts the thread and blocks until its loop exists.
    EventLoop* StartLoop();

private:
    void ThreadFunc();

    EventLoop* loop_;
    bool exiting_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cond_;
    std::string name_;
};

} // namespace network
} // namespace edgelog
