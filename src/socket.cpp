#include "socket.h"
#include "utils/logger.h"
#include <cerrno>
#include <cstring>
#include <netinet/tcp.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

Socket::Socket(int fd) : fd_(fd){
    if(fd_ < 0){
        throw std::runtime_error(std::string("socket creation failed: ") + strerror(errno));
    }
}

Socket::~Socket(){
    if(fd_ >= 0){
        ::close(fd_);
    }
}

int Socket::createNonblockingOrDie(){
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if(fd < 0){
        LOG_FATAL << "Socket::createNonblockingOrDie: " << strerror(errno);
    }
    return fd;
}

void Socket::bindAddress(uint16_t port){
    struct sockaddr_in serv_addr;
    memset(&serv_addr, 0, sizeof(serv_addr));
    serv_addr.sin_family = AF_INET;
    serv_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    serv_addr.sin_port = htons(port);

    if(::bind(fd_, reinterpret_cast<struct sockaddr*>(&serv_addr), sizeof(serv_addr)) < 0){
        throw std::runtime_error("bind() on port " + std::to_string(port) + " failed: " + strerror(errno));
    }
}

void Socket::listen(){
    if(::listen(fd_, SOMAXCONN) < 0){
        throw std::runtime_error(std::string("listen() failed: ") + strerror(errno));
    }
}

int Socket::accept(struct sockaddr_in* peer_addr, socklen_t* addr_len){
    return ::accept4(fd_, reinterpret_cast<struct sockaddr*>(peer_addr), addr_len,
                     SOCK_NONBLOCK | SOCK_CLOEXEC);
}

void Socket::shutdownWrite(){
    if(::shutdown(fd_, SHUT_WR) < 0){
        LOG_ERROR << "Socket::shutdownWrite fd=" << fd_ << ": " << strerror(errno);
    }
}

void Socket::setReuseAddr(bool on){
    int optval = on ? 1 : 0;
    if(::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0){
        LOG_WARN << "setsockopt(SO_REUSEADDR) failed: " << strerror(errno);
    }
}

void Socket::setTcpNoDelay(bool on){
    int optval = on ? 1 : 0;
    if(::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof(optval)) < 0){
        LOG_WARN << "setsockopt(TCP_NODELAY) failed: " << strerror(errno);
    }
}

uint16_t Socket::localPort() const{
    struct sockaddr_in local;
    memset(&local, 0, sizeof(local));
    socklen_t len = sizeof(local);
    if(::getsockname(fd_, reinterpret_cast<struct sockaddr*>(&local), &len) < 0){
        LOG_ERROR << "getsockname fd=" << fd_ << ": " << strerror(errno);
        return 0;
    }
    return ntohs(local.sin_port);
}
