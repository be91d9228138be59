#include "net/poller.h"
#include "net/channel.h"
#include "net/event_loop.h"
#include "utils/logger.h"
#include <cassert>
#include <cerrno>
#include <cstring>
#include <unistd.h>

Poller::Poller(EventLoop* loop)
    : owner_loop_(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize){
    if(epollfd_ < 0){
        LOG_FATAL << "epoll_create1 failed: " << strerror(errno);
    }
}

Poller::~Poller(){
    ::close(epollfd_);
}

void Poller::poll(int timeout_ms, ChannelList* active_channels){
    owner_loop_->assertInLoopThread();
    int num_events = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeout_ms);
    int saved_errno = errno;

    if(num_events > 0){
        for(int i = 0; i < num_events; i++){
            // epoll_event.data.ptr 直接存放 Channel 指针
            Channel* channel = static_cast<Channel*>(events_[i].data.ptr);
            channel->set_revents(events_[i].events);
            active_channels->push_back(channel);
        }
        if(num_events == static_cast<int>(events_.size())){
            events_.resize(events_.size() * 2);
        }
    }else if(num_events < 0 && saved_errno != EINTR){
        LOG_ERROR << "epoll_wait failed: " << strerror(saved_errno);
    }
}

void Poller::updateChannel(Channel* channel){
    owner_loop_->assertInLoopThread();
    const int fd = channel->getFd();
    auto it = channels_.find(fd);
    if(it == channels_.end()){
        channels_[fd] = channel;
        update(EPOLL_CTL_ADD, channel);
    }else{
        assert(it->second == channel);
        update(EPOLL_CTL_MOD, channel);
    }
}

void Poller::removeChannel(Channel* channel){
    owner_loop_->assertInLoopThread();
    const int fd = channel->getFd();
    auto it = channels_.find(fd);
    if(it == channels_.end()){
        return;
    }
    assert(it->second == channel);
    channels_.erase(it);
    update(EPOLL_CTL_DEL, channel);
}

void Poller::update(int operation, Channel* channel){
    struct epoll_event event;
    memset(&event, 0, sizeof(event));
    event.events = channel->getEvents();
    event.data.ptr = channel;
    int fd = channel->getFd();

    if(::epoll_ctl(epollfd_, operation, fd, &event) < 0){
        LOG_ERROR << "epoll_ctl op=" << operation << " fd=" << fd << ": " << strerror(errno);
    }
}
