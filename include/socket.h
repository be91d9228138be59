#pragma once
#include "utils/noncopyable.h"
#include <cstdint>
#include <netinet/in.h>
#include <sys/socket.h>

// 独占一个 socket fd，析构时关闭
class Socket : NonCopyable{
public:
    // fd < 0 时抛出 std::runtime_error
    explicit Socket(int fd);
    ~Socket();

    // 创建非阻塞、close-on-exec 的 IPv4 监听 socket
    static int createNonblockingOrDie();

    int getFd() const { return fd_; }

    // 绑定 0.0.0.0:port，port 为 0 时由内核分配，失败抛出 std::runtime_error
    void bindAddress(uint16_t port);
    void listen();
    // 返回新连接的 fd，EAGAIN 等情况下返回 -1 并保留 errno
    int accept(struct sockaddr_in* peer_addr, socklen_t* addr_len);
    // 关闭写半边，发送 FIN 但仍可读
    void shutdownWrite();

    void setReuseAddr(bool on);
    void setTcpNoDelay(bool on);
    // 实际绑定的端口
    uint16_t localPort() const;
private:
    const int fd_;
};
