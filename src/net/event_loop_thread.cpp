#include "net/event_loop_thread.h"
#include "net/event_loop.h"
#include "utils/logger.h"

EventLoopThread::EventLoopThread(const std::string& name)
    : loop_(nullptr), thread_(), mutex_(), cond_(), name_(name){}

EventLoopThread::~EventLoopThread(){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if(loop_ != nullptr){
            loop_->quit();
        }
    }
    if(thread_.joinable()){
        thread_.join();
    }
}

EventLoop* EventLoopThread::startLoop(){
    thread_ = std::thread(&EventLoopThread::threadFunc, this);

    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::threadFunc(){
    // 栈上的 EventLoop，生命周期与线程相同
    EventLoop loop;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        cond_.notify_one();
    }
    LOG_DEBUG << "EventLoopThread " << name_ << " started";

    loop.loop();

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}
