#pragma once

#include "edgelog/common/noncopyable.h"
#include <string>
#include <vector>
#include <memory>

namespace edgelog {
namespace network {

class EventLoop;
class EventLoopThread;

class EventLoopThreadPool : edgelog::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Round robin; the base loop when the pool has no threads.
    EventLoop* GetNextLoop();

private:
    EventLoop* baseLoop_;
    std::string name_;
    int numThreads_;
    int next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace edgelog
