#include "net/timer.h"
#include "net/event_loop.h"
#include <iterator>
#include <vector>

TimerQueue::TimerQueue(EventLoop* loop) : loop_(loop){}
TimerQueue::~TimerQueue() = default;

TimerId TimerQueue::addTimer(TimerCallback cb, Timestamp when){
    TimerPtr timer = std::make_shared<Timer>(std::move(cb), when);
    loop_->runInLoop([this, timer, when](){
        timers_.insert({when, timer});
        active_timers_.insert(timer);
    });
    return timer;
}

void TimerQueue::cancel(TimerId timer_id) {
    loop_->runInLoop([this, timer_id]() {
        auto it = active_timers_.find(timer_id);
        if (it == active_timers_.end()) {
            return;
        }
        // timers_ 持有 shared_ptr，只要还在 active_timers_ 中 lock 就一定成功
        TimerPtr timer = it->lock();
        if (timer) {
            timers_.erase({timer->expiration(), timer});
        }
        active_timers_.erase(it);
    });
}

Timestamp TimerQueue::getEarliestExpiration() const {
    if(timers_.empty()){
        return Timestamp();
    }
    return timers_.begin()->first;
}

void TimerQueue::handleExpiredTimers(){
    loop_->assertInLoopThread();
    Timestamp now = Timestamp::now();

    // 哨兵比 now 晚 1 微秒，保证取出所有 <= now 的定时器
    Entry sentry(addTime(now, 0.000001), TimerPtr());
    auto end = timers_.lower_bound(sentry);

    std::vector<Entry> expired;
    std::copy(timers_.begin(), end, std::back_inserter(expired));
    timers_.erase(timers_.begin(), end);

    for (const auto& entry : expired) {
        active_timers_.erase(entry.second);
    }
    // 回调中可能再次 addTimer/cancel，必须在修改完容器之后执行
    for (const auto& entry : expired) {
        entry.second->run();
    }
}
