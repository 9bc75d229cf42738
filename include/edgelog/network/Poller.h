#pragma once

#include "edgelog/common/noncopyable.h"
#include <vector>
#include <unordered_map>
#include <chrono>
#include <sys/epoll.h>

namespace edgelog {
namespace network {

class Channel;
class EventLoop;

// epoll(7) demultiplexer, level-triggered. Owned by one EventLoop.
class Poller : edgelog::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    ~Poller();

    std::chrono::system_clock::time_point Poll(int timeout_ms, ChannelList* active_channels);
    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);

private:
    static const int kInitEventListSize = 16;

    void FillActiveChannels(int num_events, ChannelList* active_channels) const;
    void Update(int operation, Channel* channel);

    using ChannelMap = std::unordered_map<int, Channel*>;
    using EventList = std::vector<struct epoll_event>;

    EventLoop* loop_;
    ChannelMap channels_;
    int epollfd_;
    EventList events_;
};

} // namespace network
} // namespace edgelog
