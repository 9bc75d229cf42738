#include "edgelog/network/EventLoopThread.h"
#include "edgelog/network/EventLoop.h"
#include "edgelog/common/Logger.h"

#include <pthread.h>

namespace edgelog {
namespace network {

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr),
      exiting_(false),
      name_(name) {
}

EventLoopThread::~EventLoopThread() {
    exiting_ = true;
    EventLoop* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop = loop_;
    }
    if (loop != nullptr) {
        loop->Quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread(std::bind(&EventLoopThread::ThreadFunc, this));

    EventLoop* loop = nullptr;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this]() { return loop_ != nullptr; });
        loop = loop_;
    }

    return loop;
}

void EventLoopThread::ThreadFunc() {
    if (!name_.empty()) {
        // kernel limit: 15 chars plus NUL
        const std::string shortName = name_.substr(0, 15);
        const int rc = ::pthread_setname_np(::pthread_self(), shortName.c_str());
        if (rc != 0) {
            LOG_WARN << "pthread_setname_np(" << shortName << ") failed rc=" << rc;
        }
    }
    EventLoop loop;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }

    loop.Loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace edgelog
