#pragma once
#include "utils/noncopyable.h"
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

// 按大小和按天滚动的日志文件，basename 可以带目录
class LogFile : NonCopyable {
public:
    // 第一个文件打不开时抛出 std::runtime_error
    LogFile(const std::string& basename,
            off_t roll_size,
            int flush_interval = 3,
            int check_every_n = 1024);
    ~LogFile();

    void append(const char* logline, int len);
    void flush();

    // 生成 "<basename>.YYYYmmdd-HHMMSS.<pid>.log"
    static std::string getLogFileName(const std::string& basename, time_t* now);

private:
    void append_unlocked(const char* logline, int len);
    bool rollFile();

    const std::string basename_;
    const off_t roll_size_;
    const int flush_interval_;
    const int check_every_n_;

    int count_;
    off_t written_bytes_;

    std::unique_ptr<std::mutex> mutex_;
    time_t start_of_period_;
    time_t last_roll_;
    time_t last_flush_;
    FILE* file_;

    static const int kRollPerSeconds_ = 60 * 60 * 24;
};
