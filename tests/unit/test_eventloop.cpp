#include "edgelog/network/EventLoop.h"
#include "edgelog/network/EventLoopThread.h"
#include "edgelog/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

using namespace edgelog::network;
using namespace edgelog::common;

void testRunInLoopOnOwnThread() {
    EventLoop loop;
    bool ran = false;
    // same thread: runs synchronously
    loop.RunInLoop([&ran]() { ran = true; });
    assert(ran);
    assert(loop.IsInLoopThread());
    assert(EventLoop::GetEventLoopOfCurrentThread() == &loop);
    LOG_INFO << "RunInLoop PASS";
}

void testCrossThreadQueue() {
    EventLoop loop;
    std::vector<int> order;
    std::atomic<bool> sawLoopThread{true};

    std::thread producer([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        for (int i = 0; i < 5; ++i) {
            loop.QueueInLoop([&, i]() {
                if (!loop.IsInLoopThread()) sawLoopThread = false;
                order.push_back(i);
            });
        }
        loop.QueueInLoop([&loop]() { loop.Quit(); });
    });

    loop.Loop();
    producer.join();

    assert(sawLoopThread);
    assert(order.size() == 5);
    for (int i = 0; i < 5; ++i) assert(order[i] == i);
    LOG_INFO << "Cross-thread QueueInLoop PASS";
}

void testQuitFromOtherThread() {
    EventLoop loop;
    std::thread t([&loop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        loop.Quit();
    });
    const auto start = std::chrono::steady_clock::now();
    loop.Loop();
    t.join();
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
    LOG_INFO << "Quit from other thread PASS";
}

void testEventLoopThread() {
    EventLoopThread elt;
    EventLoop* loop = elt.StartLoop();
    assert(loop != nullptr);
    assert(!loop->IsInLoopThread());

    std::atomic<int> hits{0};
    for (int i = 0; i < 10; ++i) {
        loop->RunInLoop([&hits]() { ++hits; });
    }
    for (int i = 0; i < 100 && hits.load() < 10; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(hits.load() == 10);
    LOG_INFO << "EventLoopThread PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testRunInLoopOnOwnThread();
    testCrossThreadQueue();
    testQuitFromOtherThread();
    testEventLoopThread();
    return 0;
}
