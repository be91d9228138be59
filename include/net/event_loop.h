#pragma once
#include "net/timer.h"
#include "utils/noncopyable.h"
#include "utils/timestamp.h"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

class Channel;
class Connection;
class Poller;

// one loop per thread：每个 I/O 线程一个 EventLoop，负责该线程上所有连接的读写和定时器
class EventLoop : NonCopyable{
public:
    using Functor = std::function<void()>;
    using ConnectionPtr = std::shared_ptr<Connection>;

    EventLoop();
    ~EventLoop();

    // 阻塞直到 quit()
    void loop();
    // 可以在其他线程调用
    void quit();

    void updateChannel(Channel* channel);
    void removeChannel(Channel* channel);

    void assertInLoopThread(){
        if(!isInLoopThread()){
            abortNotInLoopThread();
        }
    }
    bool isInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    // 在 loop 线程中执行，当前就在 loop 线程时立即执行
    void runInLoop(Functor cb);
    // 放入队列，在本轮 I/O 事件处理完之后执行
    void queueInLoop(Functor cb);

    TimerId runAt(Timestamp time, std::function<void()> cb);
    TimerId runAfter(double delay, std::function<void()> cb);
    void cancel(TimerId timer_id);

    // 本 loop 上的连接由 loop 自己持有，只在 loop 线程中修改
    void addConnection(int fd, ConnectionPtr conn);
    void removeConnection(const ConnectionPtr& conn);
    size_t connectionCount() const { return connections_.size(); }

private:
    void abortNotInLoopThread();
    void doPendingFunctors();
    void wakeup();
    void handleWakeup();
    void removeConnectionInLoop(const ConnectionPtr& conn);

    using ChannelList = std::vector<Channel*>;

    bool looping_;
    std::atomic<bool> quit_;
    const std::thread::id thread_id_;

    std::unique_ptr<Poller> poller_;
    std::unique_ptr<TimerQueue> timer_queue_;
    // eventfd，用于跨线程唤醒 epoll_wait
    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    ChannelList active_channels_;
    std::vector<Functor> pending_functors_;
    std::mutex mutex_;

    std::map<int, ConnectionPtr> connections_;
};
