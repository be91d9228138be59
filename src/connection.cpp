#include "connection.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "socket.h"
#include "utils/logger.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <openssl/err.h>
#include <unistd.h>

namespace {

std::string formatPeerAddr(const struct sockaddr_in& addr){
    char ip_str[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
    return std::string(ip_str) + ":" + std::to_string(ntohs(addr.sin_port));
}

std::string lastSslErrorString(){
    unsigned long code = ERR_get_error();
    if(code == 0){
        return "no detail";
    }
    char err_buf[256];
    ERR_error_string_n(code, err_buf, sizeof(err_buf));
    return err_buf;
}

} // namespace

Connection::Connection(EventLoop* loop, int sockfd, const struct sockaddr_in& peer_addr, SSL* ssl)
  : loop_(loop),
    socket_(std::make_unique<Socket>(sockfd)),
    channel_(std::make_unique<Channel>(loop, sockfd)),
    peer_addr_(peer_addr),
    peer_addr_str_(formatPeerAddr(peer_addr)),
    state_(kConnecting),
    last_active_time_(Timestamp::now()),
    ssl_(ssl, &SSL_free),
    ssl_state_(ssl ? SslState::kHandshaking : SslState::kEstablished){
    request_.setPeerAddr(peer_addr_str_);
    socket_->setTcpNoDelay(true);
}

Connection::~Connection(){
    LOG_DEBUG << "Connection fd=" << socket_->getFd() << " [" << peer_addr_str_ << "] destroyed";
}

int Connection::getFd() const {
    return socket_->getFd();
}

void Connection::connectionEstablished(){
    loop_->assertInLoopThread();

    // 绑定 Channel 生命周期，Connection 析构后不再分发事件
    channel_->tie(shared_from_this());

    // 连接建立那一刻就启动空闲定时器，握手期间也计入
    if (connection_callback_) {
        connection_callback_(shared_from_this());
    }

    if(ssl_){
        std::weak_ptr<Connection> weak_self = shared_from_this();
        auto handshake_cb = [weak_self]() {
            if (auto ptr = weak_self.lock()) ptr->handleHandshake();
        };
        channel_->setReadCallback(handshake_cb);
        channel_->setWriteCallback(handshake_cb);
        channel_->setCloseCallback([weak_self]() {
            if (auto ptr = weak_self.lock()) ptr->handleClose();
        });
        channel_->setErrorCallback([weak_self]() {
            if (auto ptr = weak_self.lock()) ptr->handleError();
        });
        channel_->enableReading();
        handleHandshake();
    }else{
        setupIoCallbacks();
        channel_->enableReading();
    }
}

void Connection::setupIoCallbacks() {
    state_ = kConnected;

    std::weak_ptr<Connection> weak_self = shared_from_this();
    channel_->setReadCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleRead();
    });
    channel_->setWriteCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleWrite();
    });
    channel_->setCloseCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleClose();
    });
    channel_->setErrorCallback([weak_self]() {
        if (auto ptr = weak_self.lock()) ptr->handleError();
    });
}

void Connection::connectDestroyed(){
    loop_->assertInLoopThread();
    if(state_ != kDisconnected){
        state_ = kDisconnected;
        channel_->disableAll();
        cancelIdleTimer();
    }
    channel_->remove();
}

void Connection::handleHandshake(){
    loop_->assertInLoopThread();
    if(state_ == kDisconnected){
        return;
    }
    ERR_clear_error();
    int ret = SSL_do_handshake(ssl_.get());
    if(ret == 1){
        ssl_state_ = SslState::kEstablished;
        LOG_DEBUG << "TLS handshake done with " << peer_addr_str_ << ", " << SSL_get_version(ssl_.get());
        setupIoCallbacks();
        if (channel_->isWriting()) channel_->disableWriting();
        if (!channel_->isReading()) channel_->enableReading();
        // 握手的最后一个记录里可能已经带了应用数据
        if (SSL_pending(ssl_.get()) > 0) {
            handleRead();
        }
        return;
    }

    int err = SSL_get_error(ssl_.get(), ret);
    if (err == SSL_ERROR_WANT_READ) {
        if (!channel_->isReading()) channel_->enableReading();
        if (channel_->isWriting()) channel_->disableWriting();
    } else if (err == SSL_ERROR_WANT_WRITE) {
        if (!channel_->isWriting()) channel_->enableWriting();
    } else {
        LOG_WARN << "TLS handshake with " << peer_addr_str_ << " failed, fd=" << socket_->getFd()
                 << ", SSL err=" << err << ", detail: " << lastSslErrorString();
        handleError();
    }
}

void Connection::send(const std::string& msg){
    if(loop_->isInLoopThread()){
        sendInLoop(msg);
    }else{
        // 跨线程发送，数据拷贝一份交给 I/O 线程
        ConnectionPtr self = shared_from_this();
        loop_->runInLoop([self, msg](){ self->sendInLoop(msg); });
    }
}

void Connection::send(Buffer* buf){
    send(buf->retrieveAllAsString());
}

ssize_t Connection::writeSome(const char* data, size_t len){
    if(ssl_){
        ERR_clear_error();
        int n = SSL_write(ssl_.get(), data, static_cast<int>(len));
        if(n > 0){
            return n;
        }
        int err = SSL_get_error(ssl_.get(), n);
        if(err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ){
            return 0;
        }
        LOG_WARN << "SSL_write to " << peer_addr_str_ << " failed, SSL err=" << err
                 << ", detail: " << lastSslErrorString();
        return -1;
    }

    ssize_t n = ::write(socket_->getFd(), data, len);
    if(n >= 0){
        return n;
    }
    if(errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR){
        return 0;
    }
    LOG_WARN << "write to " << peer_addr_str_ << " failed: " << strerror(errno);
    return -1;
}

void Connection::sendInLoop(const std::string& msg){
    loop_->assertInLoopThread();
    if(state_ == kDisconnected || state_ == kDisconnecting){
        LOG_WARN << "Connection to " << peer_addr_str_ << " is closing, give up writing";
        return;
    }
    size_t nwrote = 0;

    // 输出缓冲区为空时先尝试直接发送
    if(!channel_->isWriting() && output_buffer_.readableBytes() == 0){
        ssize_t n = writeSome(msg.data(), msg.size());
        if(n < 0){
            handleError();
            return;
        }
        nwrote = static_cast<size_t>(n);
        updateLastActiveTime();
        if(nwrote == msg.size()){
            return;
        }
    }

    output_buffer_.append(msg.data() + nwrote, msg.size() - nwrote);
    if(!channel_->isWriting()){
        channel_->enableWriting();
    }
}

bool Connection::readPlain(){
    int saved_errno = 0;
    while (true) {
        ssize_t n = input_buffer_.readFd(socket_->getFd(), &saved_errno);
        if (n > 0) {
            continue;
        }
        if (n == 0) {
            handleClose();
            return false;
        }
        if (saved_errno == EAGAIN || saved_errno == EWOULDBLOCK) {
            return true;
        }
        if (saved_errno == EINTR) {
            continue;
        }
        LOG_WARN << "read from " << peer_addr_str_ << " failed: " << strerror(saved_errno);
        handleError();
        return false;
    }
}

bool Connection::readTls(){
    char buf[16384];
    while (true) {
        ERR_clear_error();
        int n = SSL_read(ssl_.get(), buf, sizeof(buf));
        if (n > 0) {
            input_buffer_.append(buf, static_cast<size_t>(n));
            continue;
        }
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            return true;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            // 对端发来 close_notify
            LOG_DEBUG << "TLS close_notify from " << peer_addr_str_;
        } else if (err == SSL_ERROR_SYSCALL && errno == 0) {
            // 对端直接断开 TCP，浏览器关闭标签页时很常见
            LOG_DEBUG << "SSL_read unexpected EOF from " << peer_addr_str_;
        } else {
            LOG_WARN << "SSL_read from " << peer_addr_str_ << " failed, SSL err=" << err
                     << ", detail: " << lastSslErrorString();
        }
        handleClose();
        return false;
    }
}

void Connection::handleRead() {
    loop_->assertInLoopThread();
    if (state_ == kDisconnected) {
        return;
    }
    bool open = ssl_ ? readTls() : readPlain();
    if (!open) {
        return;
    }
    if (input_buffer_.readableBytes() == 0) {
        return;
    }
    updateLastActiveTime();
    if (state_ == kConnected) {
        if (message_callback_) {
            message_callback_(shared_from_this(), &input_buffer_);
        }
    } else {
        // 正在关闭，后续数据没有意义
        input_buffer_.retrieveAll();
    }
}

void Connection::handleWrite(){
    loop_->assertInLoopThread();
    if(!channel_->isWriting()){
        return;
    }
    while(output_buffer_.readableBytes() > 0){
        ssize_t n = writeSome(output_buffer_.peek(), output_buffer_.readableBytes());
        if(n < 0){
            handleError();
            return;
        }
        if(n == 0){
            // 内核缓冲区已满，等待下一次可写通知
            return;
        }
        updateLastActiveTime();
        output_buffer_.retrieve(static_cast<size_t>(n));
    }
    // 数据发送完毕，必须停止监听可写事件，否则会 busy-loop
    channel_->disableWriting();
    if(state_ == kDisconnecting){
        if(ssl_){
            SSL_shutdown(ssl_.get());
        }
        socket_->shutdownWrite();
    }
}

void Connection::handleClose(){
    loop_->assertInLoopThread();
    if(state_ == kDisconnected){
        return;
    }
    LOG_DEBUG << "Connection fd=" << socket_->getFd() << " [" << peer_addr_str_ << "] closing";
    state_ = kDisconnected;
    channel_->disableAll();
    cancelIdleTimer();

    ConnectionPtr guard_this(shared_from_this());
    if(close_callback_){
        close_callback_(guard_this);
    }
}

void Connection::handleError(){
    int err = 0;
    socklen_t len = sizeof(err);
    if(::getsockopt(socket_->getFd(), SOL_SOCKET, SO_ERROR, &err, &len) == 0 && err != 0){
        LOG_DEBUG << "Connection [" << peer_addr_str_ << "] SO_ERROR: " << strerror(err);
    }
    handleClose();
}

void Connection::shutdown(){
    if(loop_->isInLoopThread()){
        shutdownInLoop();
    }else{
        ConnectionPtr self = shared_from_this();
        loop_->runInLoop([self](){ self->shutdownInLoop(); });
    }
}

void Connection::shutdownInLoop() {
    loop_->assertInLoopThread();
    if (state_ != kConnected) {
        return;
    }
    state_ = kDisconnecting;
    // 还有数据没发完时，由 handleWrite 在发完之后关闭
    if (!channel_->isWriting()) {
        if (ssl_) {
            SSL_shutdown(ssl_.get());
        }
        socket_->shutdownWrite();
    }
}

void Connection::forceClose() {
    ConnectionPtr self = shared_from_this();
    loop_->runInLoop([self](){ self->forceCloseInLoop(); });
}

void Connection::forceCloseInLoop() {
    loop_->assertInLoopThread();
    if (state_ != kDisconnected) {
        handleClose();
    }
}

void Connection::cancelIdleTimer(){
    if(!timer_id_.expired()){
        loop_->cancel(timer_id_);
    }
    timer_id_.reset();
}
