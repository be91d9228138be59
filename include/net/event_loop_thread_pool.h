#pragma once
#include "utils/noncopyable.h"
#include <memory>
#include <string>
#include <vector>

class EventLoop;
class EventLoopThread;

// 主 Reactor 负责 accept，新连接按轮询分配给工作线程的 EventLoop
class EventLoopThreadPool : NonCopyable{
public:
    EventLoopThreadPool(EventLoop* base_loop, const std::string& name, int num_threads);
    ~EventLoopThreadPool();

    void start();

    // 没有工作线程时返回 base_loop
    EventLoop* getNextLoop();
    int numThreads() const { return num_threads_; }
private:
    EventLoop* base_loop_;
    std::string name_;
    int num_threads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};
