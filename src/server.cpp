#include "server.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "net/event_loop_thread_pool.h"
#include "net/ssl_context.h"
#include "socket.h"
#include "utils/logger.h"
#include <cerrno>
#include <cstring>
#include <openssl/err.h>
#include <unistd.h>

Server::Server(EventLoop* loop, const std::string& name, uint16_t port,
               int idle_timeout_sec, int num_threads)
  : loop_(loop),
    name_(name),
    idle_timeout_sec_(idle_timeout_sec),
    listen_socket_(new Socket(Socket::createNonblockingOrDie())),
    accept_channel_(new Channel(loop, listen_socket_->getFd())),
    started_(false),
    thread_pool_(new EventLoopThreadPool(loop, name, num_threads)){
    listen_socket_->setReuseAddr(true);
    listen_socket_->bindAddress(port);
    accept_channel_->setReadCallback([this](){ handleAccept(); });
}

Server::~Server() {
    loop_->assertInLoopThread();
    LOG_INFO << "Server " << name_ << " stops listening on port " << port();
    // 先停止工作线程，它们的连接随各自的 EventLoop 一起释放
    thread_pool_.reset();
    accept_channel_->disableAll();
    accept_channel_->remove();
}

uint16_t Server::port() const {
    return listen_socket_->localPort();
}

void Server::enableSsl(const std::string& cert_path, const std::string& key_path){
    ssl_context_ = std::make_unique<SslContext>(cert_path, key_path);
}

void Server::start(){
    loop_->assertInLoopThread();
    if(started_){
        return;
    }
    started_ = true;
    thread_pool_->start();
    listen_socket_->listen();
    accept_channel_->enableReading();
    LOG_INFO << "Server " << name_ << " listening on port " << port()
             << (ssl_context_ ? " (TLS)" : "") << " with "
             << thread_pool_->numThreads() << " worker thread(s)";
}

SSL* Server::createSsl(int connfd){
    SSL* ssl = SSL_new(ssl_context_->get());
    if(!ssl){
        LOG_ERROR << "SSL_new failed: " << ERR_error_string(ERR_get_error(), nullptr);
        return nullptr;
    }
    if(SSL_set_fd(ssl, connfd) == 0){
        LOG_ERROR << "SSL_set_fd failed: " << ERR_error_string(ERR_get_error(), nullptr);
        SSL_free(ssl);
        return nullptr;
    }
    SSL_set_accept_state(ssl);
    return ssl;
}

void Server::handleAccept(){
    loop_->assertInLoopThread();
    // 一次可读事件可能对应多个已完成握手的连接
    while(true){
        struct sockaddr_in peer_addr;
        memset(&peer_addr, 0, sizeof(peer_addr));
        socklen_t addr_len = sizeof(peer_addr);
        int connfd = listen_socket_->accept(&peer_addr, &addr_len);
        if(connfd < 0){
            int saved_errno = errno;
            if(saved_errno != EAGAIN && saved_errno != EWOULDBLOCK && saved_errno != EINTR){
                LOG_ERROR << "Server " << name_ << " accept failed: " << strerror(saved_errno);
            }
            break;
        }

        SSL* ssl = nullptr;
        if(ssl_context_){
            ssl = createSsl(connfd);
            if(!ssl){
                ::close(connfd);
                continue;
            }
        }

        EventLoop* io_loop = thread_pool_->getNextLoop();
        double idle_timeout = idle_timeout_sec_;
        ConnectionCallback user_connection_cb = connection_callback_;
        MessageCallback message_cb = message_callback_;
        // 不捕获 this：工作线程可能在 Server 析构过程中才执行这个任务
        io_loop->runInLoop([io_loop, connfd, peer_addr, ssl, idle_timeout,
                            user_connection_cb, message_cb](){
            ConnectionPtr conn = std::make_shared<Connection>(io_loop, connfd, peer_addr, ssl);
            conn->setConnectionCallback([idle_timeout, user_connection_cb](const ConnectionPtr& c){
                LOG_DEBUG << "New connection from [" << c->getPeerAddrStr() << "], fd=" << c->getFd();
                Server::scheduleIdleCheck(c, idle_timeout);
                if(user_connection_cb){
                    user_connection_cb(c);
                }
            });
            conn->setMessageCallback(message_cb);
            conn->setCloseCallback([io_loop](const ConnectionPtr& c){
                io_loop->removeConnection(c);
            });
            io_loop->addConnection(connfd, conn);
            conn->connectionEstablished();
        });
    }
}

void Server::scheduleIdleCheck(const ConnectionPtr& conn, double idle_timeout_sec){
    std::weak_ptr<Connection> weak_conn = conn;
    Timestamp deadline = addTime(conn->getLastActiveTime(), idle_timeout_sec);
    double delay = static_cast<double>(deadline.microSecondSinceEpoch()
                                       - Timestamp::now().microSecondSinceEpoch())
                   / Timestamp::kMicroSecondsPerSecond;
    if(delay < 0){
        delay = 0;
    }
    TimerId timer_id = conn->getLoop()->runAfter(delay, [weak_conn, idle_timeout_sec](){
        ConnectionPtr conn_ptr = weak_conn.lock();
        if(!conn_ptr || conn_ptr->state() == Connection::kDisconnected){
            return;
        }
        Timestamp deadline = addTime(conn_ptr->getLastActiveTime(), idle_timeout_sec);
        if(Timestamp::now() < deadline){
            // 期间有过读写，按剩余时间重新计时
            Server::scheduleIdleCheck(conn_ptr, idle_timeout_sec);
            return;
        }
        LOG_INFO << "Connection from [" << conn_ptr->getPeerAddrStr() << "] idle for "
                 << idle_timeout_sec << "s, closing";
        conn_ptr->forceClose();
    });
    conn->setTimerId(timer_id);
}
