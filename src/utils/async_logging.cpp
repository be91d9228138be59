#include "utils/async_logging.h"
#include "utils/logfile.h"
#include <cassert>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <stdexcept>

AsyncLogging::AsyncLogging(const std::string& basename, off_t roll_size, int flush_interval)
    : flush_interval_(flush_interval),
      running_(false),
      basename_(basename),
      roll_size_(roll_size),
      thread_(),
      mutex_(),
      cond_(),
      current_buffer_(new Buffer),
      next_buffer_(new Buffer),
      buffers_(),
      started_(false) {
    current_buffer_->bzero();
    next_buffer_->bzero();
    buffers_.reserve(16);
}

AsyncLogging::~AsyncLogging() {
    if (running_) {
        stop();
    }
}

void AsyncLogging::append(const char* logline, int len) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_buffer_->avail() > static_cast<size_t>(len)) {
        current_buffer_->append(logline, len);
        return;
    }
    buffers_.push_back(std::move(current_buffer_));
    if (next_buffer_) {
        current_buffer_ = std::move(next_buffer_);
    } else {
        current_buffer_.reset(new Buffer);
    }
    current_buffer_->append(logline, len);
    cond_.notify_one();
}

void AsyncLogging::start() {
    running_ = true;
    thread_ = std::thread(&AsyncLogging::threadFunc, this);

    std::unique_lock<std::mutex> lock(start_mutex_);
    start_cond_.wait(lock, [this] { return started_; });
    if (!start_error_.empty()) {
        lock.unlock();
        stop();
        throw std::runtime_error(start_error_);
    }
}

void AsyncLogging::stop() {
    running_ = false;
    cond_.notify_one();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AsyncLogging::flush() {
    cond_.notify_one();
}

void AsyncLogging::threadFunc() {
    std::unique_ptr<LogFile> output;
    try {
        output.reset(new LogFile(basename_, roll_size_, flush_interval_));
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(start_mutex_);
        start_error_ = e.what();
        started_ = true;
        start_cond_.notify_one();
        return;
    }
    {
        std::lock_guard<std::mutex> lock(start_mutex_);
        started_ = true;
        start_cond_.notify_one();
    }

    BufferPtr new_buffer1(new Buffer);
    BufferPtr new_buffer2(new Buffer);
    new_buffer1->bzero();
    new_buffer2->bzero();

    BufferVector buffers_to_write;
    buffers_to_write.reserve(16);

    while (running_) {
        assert(new_buffer1 && new_buffer1->length() == 0);
        assert(new_buffer2 && new_buffer2->length() == 0);
        assert(buffers_to_write.empty());

        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (buffers_.empty()) {
                cond_.wait_for(lock, std::chrono::seconds(flush_interval_));
            }
            buffers_.push_back(std::move(current_buffer_));
            current_buffer_ = std::move(new_buffer1);
            buffers_to_write.swap(buffers_);
            if (!next_buffer_) {
                next_buffer_ = std::move(new_buffer2);
            }
        }

        // 日志堆积过多时丢弃中间部分，只留最早的两块
        if (buffers_to_write.size() > 25) {
            char msg[128];
            snprintf(msg, sizeof(msg), "Dropped %zu log buffers\n", buffers_to_write.size() - 2);
            fputs(msg, stderr);
            output->append(msg, static_cast<int>(strlen(msg)));
            buffers_to_write.erase(buffers_to_write.begin() + 2, buffers_to_write.end());
        }

        for (const auto& buffer : buffers_to_write) {
            output->append(buffer->data(), buffer->length());
        }

        if (buffers_to_write.size() > 2) {
            buffers_to_write.resize(2);
        }
        if (!new_buffer1) {
            new_buffer1 = std::move(buffers_to_write.back());
            buffers_to_write.pop_back();
            new_buffer1->reset();
        }
        if (!new_buffer2) {
            new_buffer2 = std::move(buffers_to_write.back());
            buffers_to_write.pop_back();
            new_buffer2->reset();
        }
        buffers_to_write.clear();
        output->flush();
    }

    // 退出前把前端剩余的日志也写掉
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& buffer : buffers_) {
        output->append(buffer->data(), buffer->length());
    }
    if (current_buffer_ && current_buffer_->length() > 0) {
        output->append(current_buffer_->data(), current_buffer_->length());
        current_buffer_->reset();
    }
    buffers_.clear();
    output->flush();
}
