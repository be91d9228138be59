#pragma once
#include "connection.h"
#include "utils/noncopyable.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

class Channel;
class EventLoop;
class EventLoopThreadPool;
class Socket;
class SslContext;

// 主 Reactor：在 base loop 上 accept，连接轮询分配给工作线程
// 构造、start 和析构都必须在 base loop 线程中进行
class Server : NonCopyable{
public:
    using ConnectionPtr = std::shared_ptr<Connection>;
    using ConnectionCallback = Connection::ConnectionCallback;
    using MessageCallback = Connection::MessageCallback;

    // port 为 0 时由内核分配，绑定失败抛出 std::runtime_error
    Server(EventLoop* loop, const std::string& name, uint16_t port,
           int idle_timeout_sec, int num_threads = 0);
    ~Server();

    // 证书或私钥加载失败抛出 std::runtime_error，必须在 start 之前调用
    void enableSsl(const std::string& cert_path, const std::string& key_path);

    void start();

    void setConnectionCallback(ConnectionCallback cb) { connection_callback_ = std::move(cb); }
    void setMessageCallback(MessageCallback cb) { message_callback_ = std::move(cb); }

    const std::string& name() const { return name_; }
    // 实际监听的端口
    uint16_t port() const;
    bool sslEnabled() const { return ssl_context_ != nullptr; }

    // 空闲检查：到期时若连接在这段时间内没有读写则关闭，否则按剩余时间重新计时
    static void scheduleIdleCheck(const ConnectionPtr& conn, double idle_timeout_sec);

private:
    void handleAccept();
    SSL* createSsl(int connfd);

    EventLoop* loop_;
    const std::string name_;
    const int idle_timeout_sec_;

    std::unique_ptr<Socket> listen_socket_;
    std::unique_ptr<Channel> accept_channel_;
    std::unique_ptr<SslContext> ssl_context_;

    ConnectionCallback connection_callback_;
    MessageCallback message_callback_;

    bool started_;
    // 最后声明，最先析构：工作线程先退出，再释放其余成员
    std::unique_ptr<EventLoopThreadPool> thread_pool_;
};
