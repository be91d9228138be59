#pragma once
#include <algorithm>
#include <cassert>
#include <cstring>
#include <string>
#include <sys/types.h>
#include <vector>

// 连接的输入/输出缓冲区
// +-------------------+------------------+------------------+
// | prependable bytes |  readable bytes  |  writable bytes  |
// +-------------------+------------------+------------------+
// 0          reader_index_       write_index_         size()
class Buffer{
public:
    static const size_t kCheapPrepend = 8;
    static const size_t kInitialSize = 1024;

    explicit Buffer(size_t initial_size = kInitialSize)
        : buffer_(kCheapPrepend + initial_size),
          reader_index_(kCheapPrepend),
          write_index_(kCheapPrepend) {}

    const char* peek() const { return begin() + reader_index_; }
    size_t readableBytes() const { return write_index_ - reader_index_; }
    size_t writableBytes() const { return buffer_.size() - write_index_; }
    size_t prependableBytes() const { return reader_index_; }

    // 可读区域内第一个 "\r\n"，没有则返回 nullptr
    const char* findCRLF() const {
        const char* crlf = std::search(peek(), beginWrite(), kCRLF, kCRLF + 2);
        return crlf == beginWrite() ? nullptr : crlf;
    }

    void retrieve(size_t len){
        assert(len <= readableBytes());
        if(len < readableBytes()){
            reader_index_ += len;
        }else{
            retrieveAll();
        }
    }
    void retrieveUntil(const char* end){
        assert(peek() <= end);
        assert(end <= beginWrite());
        retrieve(end - peek());
    }
    void retrieveAll(){
        reader_index_ = kCheapPrepend;
        write_index_ = kCheapPrepend;
    }
    std::string retrieveAllAsString(){
        return retrieveAsString(readableBytes());
    }
    std::string retrieveAsString(size_t len){
        assert(len <= readableBytes());
        std::string result(peek(), len);
        retrieve(len);
        return result;
    }

    void append(const char* data, size_t len){
        ensureWritableBytes(len);
        std::copy(data, data + len, beginWrite());
        hasWritten(len);
    }
    void append(const std::string& str){
        append(str.data(), str.length());
    }
    void append(const char* str){
        append(str, strlen(str));
    }

    // 从 fd 读取数据，栈上 64KB 额外空间配合 readv，一次系统调用尽量读完
    ssize_t readFd(int fd, int* saved_errno);

private:
    char* begin() { return buffer_.data(); }
    const char* begin() const { return buffer_.data(); }
    char* beginWrite() { return begin() + write_index_; }
    const char* beginWrite() const { return begin() + write_index_; }

    void hasWritten(size_t len) { write_index_ += len; }

    void ensureWritableBytes(size_t len){
        if(writableBytes() < len){
            makeSpace(len);
        }
        assert(writableBytes() >= len);
    }

    void makeSpace(size_t len);

    static const char kCRLF[];

    std::vector<char> buffer_;
    size_t reader_index_;
    size_t write_index_;
};
