#include "net/event_loop_thread_pool.h"
#include "net/event_loop.h"
#include "net/event_loop_thread.h"

EventLoopThreadPool::EventLoopThreadPool(EventLoop* base_loop, const std::string& name, int num_threads)
    : base_loop_(base_loop), name_(name), num_threads_(num_threads), next_(0){}

// EventLoopThread 的析构负责 quit 和 join
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::start(){
    base_loop_->assertInLoopThread();
    for(int i = 0; i < num_threads_; i++){
        threads_.push_back(std::make_unique<EventLoopThread>(name_ + std::to_string(i)));
        loops_.push_back(threads_.back()->startLoop());
    }
}

EventLoop* EventLoopThreadPool::getNextLoop(){
    base_loop_->assertInLoopThread();
    if(loops_.empty()){
        return base_loop_;
    }
    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}
