#pragma once
#include <cstdint>
#include <functional>
#include <memory>

class EventLoop;

// fd 上的事件分发器，不拥有 fd，生命周期由 Connection、Server 或 EventLoop 管理
class Channel{
public:
    using EventCallback = std::function<void()>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    // 由 EventLoop 在 poll 返回后调用
    void handleEvent();

    // 绑定拥有者，拥有者已析构时不再分发事件
    void tie(const std::shared_ptr<void>& obj);

    void setReadCallback(EventCallback cb) { read_callback_ = std::move(cb); }
    void setWriteCallback(EventCallback cb) { write_callback_ = std::move(cb); }
    void setCloseCallback(EventCallback cb) { close_callback_ = std::move(cb); }
    void setErrorCallback(EventCallback cb) { error_callback_ = std::move(cb); }

    int getFd() const { return fd_; }
    int getEvents() const { return events_; }
    void set_revents(uint32_t revt) { revents_ = revt; }

    bool isNoneEvent() const { return events_ == kNoneEvent; }
    bool isWriting() const { return events_ & kWriteEvent; }
    bool isReading() const { return events_ & kReadEvent; }

    void enableReading();
    void disableReading();
    void enableWriting();
    void disableWriting();
    void disableAll();

    // 从所属 EventLoop 的 Poller 中注销
    void remove();

    EventLoop* ownerLoop() { return loop_; }

private:
    void update();
    void handleEventWithGuard();

    static const int kNoneEvent;
    static const int kReadEvent;
    static const int kWriteEvent;

    EventLoop* loop_;
    const int fd_;
    int events_;
    uint32_t revents_;
    std::weak_ptr<void> tie_;
    bool tied_;
    bool added_to_loop_;

    EventCallback read_callback_;
    EventCallback write_callback_;
    EventCallback close_callback_;
    EventCallback error_callback_;
};
