#pragma once
#include <map>
#include <sys/epoll.h>
#include <vector>

class Channel;
class EventLoop;

// epoll 的薄封装，由 EventLoop 独占
class Poller{
public:
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    ~Poller();

    // epoll_wait，把活跃的 Channel 填入 active_channels
    void poll(int timeout_ms, ChannelList* active_channels);

    void updateChannel(Channel* channel);
    void removeChannel(Channel* channel);

private:
    static const int kInitEventListSize = 16;

    void update(int operation, Channel* channel);

    using ChannelMap = std::map<int, Channel*>;

    EventLoop* owner_loop_;
    ChannelMap channels_;
    int epollfd_;
    std::vector<struct epoll_event> events_;
};
