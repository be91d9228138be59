#include "net/event_loop.h"
#include "net/channel.h"
#include "net/poller.h"
#include "connection.h"
#include "utils/logger.h"
#include <cassert>
#include <cerrno>
#include <cstring>
#include <sys/eventfd.h>
#include <unistd.h>

namespace {

// 每个线程最多一个 EventLoop
thread_local EventLoop* t_loop_in_this_thread = nullptr;

int createEventfd(){
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if(fd < 0){
        LOG_FATAL << "eventfd failed: " << strerror(errno);
    }
    return fd;
}

} // namespace

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new Poller(this)),
      timer_queue_(new TimerQueue(this)),
      wakeup_fd_(createEventfd()),
      wakeup_channel_(new Channel(this, wakeup_fd_)){
    if(t_loop_in_this_thread){
        LOG_FATAL << "Another EventLoop " << t_loop_in_this_thread << " exists in this thread";
    }
    t_loop_in_this_thread = this;
    wakeup_channel_->setReadCallback([this](){ handleWakeup(); });
    wakeup_channel_->enableReading();
}

EventLoop::~EventLoop() {
    assert(!looping_);

    // 先执行退出前排入的任务，其中可能有延后的 connectDestroyed
    doPendingFunctors();

    // 退出时仍然存活的连接，先注销它们的 Channel 再释放
    std::map<int, ConnectionPtr> remaining;
    remaining.swap(connections_);
    for(auto& pair : remaining){
        pair.second->connectDestroyed();
    }
    remaining.clear();
    // 此时排入的任务不会再有机会执行
    pending_functors_.clear();

    wakeup_channel_->disableAll();
    wakeup_channel_->remove();
    ::close(wakeup_fd_);
    t_loop_in_this_thread = nullptr;
}

void EventLoop::loop(){
    assert(!looping_);
    assertInLoopThread();
    looping_ = true;

    while(!quit_){
        active_channels_.clear();

        // 根据最早的定时器计算 epoll_wait 超时
        int timeout_ms = 10000;
        Timestamp earliest = timer_queue_->getEarliestExpiration();
        if(earliest.valid()){
            int64_t diff = earliest.microSecondSinceEpoch() - Timestamp::now().microSecondSinceEpoch();
            int64_t ms = diff <= 0 ? 0 : (diff + 999) / 1000;
            if(ms < timeout_ms){
                timeout_ms = static_cast<int>(ms);
            }
        }
        poller_->poll(timeout_ms, &active_channels_);

        for(Channel* channel : active_channels_){
            channel->handleEvent();
        }
        doPendingFunctors();
        timer_queue_->handleExpiredTimers();
    }

    looping_ = false;
}

void EventLoop::handleWakeup(){
    uint64_t one = 1;
    ssize_t n = ::read(wakeup_fd_, &one, sizeof(one));
    if(n != sizeof(one)){
        LOG_ERROR << "EventLoop::handleWakeup reads " << static_cast<long>(n) << " bytes instead of 8";
    }
}

void EventLoop::quit(){
    quit_ = true;
    if(!isInLoopThread()){
        wakeup();
    }
}

void EventLoop::updateChannel(Channel* channel){
    assert(channel->ownerLoop() == this);
    assertInLoopThread();
    poller_->updateChannel(channel);
}

void EventLoop::removeChannel(Channel* channel){
    assert(channel->ownerLoop() == this);
    assertInLoopThread();
    poller_->removeChannel(channel);
}

void EventLoop::runInLoop(Functor cb){
    if(isInLoopThread()){
        cb();
    }else{
        queueInLoop(std::move(cb));
    }
}

void EventLoop::queueInLoop(Functor cb){
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.push_back(std::move(cb));
    }
    wakeup();
}

void EventLoop::wakeup(){
    uint64_t one = 1;
    ssize_t n = ::write(wakeup_fd_, &one, sizeof(one));
    if(n != sizeof(one)){
        LOG_ERROR << "EventLoop::wakeup writes " << static_cast<long>(n) << " bytes instead of 8";
    }
}

void EventLoop::doPendingFunctors(){
    std::vector<Functor> functors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }
    for(const Functor& functor : functors){
        functor();
    }
}

void EventLoop::abortNotInLoopThread(){
    LOG_FATAL << "EventLoop::abortNotInLoopThread - EventLoop " << this
              << " was created in thread " << thread_id_
              << ", current thread " << std::this_thread::get_id();
}

TimerId EventLoop::runAt(Timestamp time, std::function<void()> cb){
    return timer_queue_->addTimer(std::move(cb), time);
}

TimerId EventLoop::runAfter(double delay, std::function<void()> cb){
    return runAt(addTime(Timestamp::now(), delay), std::move(cb));
}

void EventLoop::cancel(TimerId timer_id){
    timer_queue_->cancel(std::move(timer_id));
}

void EventLoop::addConnection(int fd, ConnectionPtr conn){
    assertInLoopThread();
    connections_[fd] = std::move(conn);
    LOG_DEBUG << "EventLoop " << this << " added connection fd=" << fd;
}

void EventLoop::removeConnection(const ConnectionPtr& conn){
    runInLoop([this, conn](){ removeConnectionInLoop(conn); });
}

void EventLoop::removeConnectionInLoop(const ConnectionPtr& conn){
    assertInLoopThread();
    int fd = conn->getFd();
    connections_.erase(fd);

    // 当前可能正处于该连接 Channel 的回调中，延后到本轮事件处理完再注销 Channel；
    // lambda 持有 conn，执行完毕后 Connection 才析构
    queueInLoop([conn](){
        conn->connectDestroyed();
    });
    LOG_DEBUG << "EventLoop " << this << " removed connection fd=" << fd;
}
