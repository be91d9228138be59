#pragma once
#include "buffer.h"
#include "http_request.h"
#include "net/timer.h"
#include "utils/noncopyable.h"
#include "utils/timestamp.h"
#include <functional>
#include <memory>
#include <netinet/in.h>
#include <openssl/ssl.h>
#include <string>

class Channel;
class EventLoop;
class Socket;

// 一个 TCP（或 TLS）连接，由所属 EventLoop 的连接表持有 shared_ptr
// 除 send/forceClose 外所有方法都只能在所属 loop 线程调用
class Connection : NonCopyable, public std::enable_shared_from_this<Connection>{
public:
    enum StateE { kConnecting, kConnected, kDisconnecting, kDisconnected };

    using ConnectionPtr = std::shared_ptr<Connection>;
    using ConnectionCallback = std::function<void(const ConnectionPtr&)>;
    using MessageCallback = std::function<void(const ConnectionPtr&, Buffer*)>;
    using CloseCallback = std::function<void(const ConnectionPtr&)>;

    // ssl 为 nullptr 则为普通 HTTP 连接，否则接管 ssl 的所有权
    Connection(EventLoop* loop, int sockfd, const struct sockaddr_in& peer_addr, SSL* ssl);
    ~Connection();

    void send(const std::string& msg);
    void send(Buffer* buf);

    void setConnectionCallback(ConnectionCallback cb) { connection_callback_ = std::move(cb); }
    void setMessageCallback(MessageCallback cb) { message_callback_ = std::move(cb); }
    void setCloseCallback(CloseCallback cb) { close_callback_ = std::move(cb); }

    // 加入 loop 的连接表之后调用，开始监听读事件；TLS 连接先进入握手
    void connectionEstablished();
    // 从连接表移除之后调用，注销 Channel，之后对象可以安全析构
    void connectDestroyed();

    // 输出缓冲区发完后关闭写半边
    void shutdown();
    // 立即关闭，可跨线程调用
    void forceClose();

    bool connected() const { return state_ == kConnected; }
    bool isTls() const { return ssl_ != nullptr; }
    StateE state() const { return state_; }

    std::string getPeerAddrStr() const { return peer_addr_str_; }
    int getFd() const;
    EventLoop* getLoop() const { return loop_; }

    void setTimerId(TimerId id) { timer_id_ = std::move(id); }
    TimerId getTimerId() const { return timer_id_; }

    void updateLastActiveTime() { last_active_time_ = Timestamp::now(); }
    Timestamp getLastActiveTime() const { return last_active_time_; }

    // 每个连接复用一个增量解析器
    HttpRequest& getRequest() { return request_; }

private:
    enum class SslState { kHandshaking, kEstablished };

    void handleRead();
    void handleWrite();
    void handleClose();
    void handleError();
    void handleHandshake();

    // 握手完成（或普通连接建立）后安装读写回调
    void setupIoCallbacks();
    bool readPlain();
    bool readTls();
    // 返回写出的字节数，出错返回 -1，内核缓冲区已满返回 0
    ssize_t writeSome(const char* data, size_t len);

    void sendInLoop(const std::string& msg);
    void shutdownInLoop();
    void forceCloseInLoop();
    void cancelIdleTimer();

    EventLoop* loop_;
    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    Buffer input_buffer_;
    Buffer output_buffer_;

    ConnectionCallback connection_callback_;
    MessageCallback message_callback_;
    CloseCallback close_callback_;

    struct sockaddr_in peer_addr_;
    const std::string peer_addr_str_;
    StateE state_;
    TimerId timer_id_;
    Timestamp last_active_time_;

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl_;
    SslState ssl_state_;
    HttpRequest request_;
};
