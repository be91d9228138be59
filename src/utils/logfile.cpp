#include "utils/logfile.h"
#include <filesystem>
#include <stdexcept>
#include <unistd.h>

LogFile::LogFile(const std::string& basename,
                 off_t roll_size,
                 int flush_interval,
                 int check_every_n)
    : basename_(basename),
      roll_size_(roll_size),
      flush_interval_(flush_interval),
      check_every_n_(check_every_n),
      count_(0),
      written_bytes_(0),
      mutex_(new std::mutex),
      start_of_period_(0),
      last_roll_(0),
      last_flush_(0),
      file_(nullptr) {
    std::filesystem::path parent = std::filesystem::path(basename_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    if (!rollFile()) {
        throw std::runtime_error("LogFile: cannot open log file for " + basename_);
    }
}

LogFile::~LogFile() {
    if (file_) {
        ::fclose(file_);
    }
}

void LogFile::append(const char* logline, int len) {
    std::lock_guard<std::mutex> lock(*mutex_);
    append_unlocked(logline, len);
}

void LogFile::flush() {
    std::lock_guard<std::mutex> lock(*mutex_);
    ::fflush(file_);
}

void LogFile::append_unlocked(const char* logline, int len) {
    size_t n = ::fwrite_unlocked(logline, 1, len, file_);
    written_bytes_ += static_cast<off_t>(n);

    if (written_bytes_ > roll_size_) {
        rollFile();
        return;
    }
    if (++count_ < check_every_n_) {
        return;
    }
    count_ = 0;
    time_t now = ::time(nullptr);
    time_t this_period = now / kRollPerSeconds_ * kRollPerSeconds_;
    if (this_period != start_of_period_) {
        rollFile();
    } else if (now - last_flush_ > flush_interval_) {
        last_flush_ = now;
        ::fflush(file_);
    }
}

// 打开失败时保留旧文件继续写
bool LogFile::rollFile() {
    time_t now = 0;
    std::string filename = getLogFileName(basename_, &now);
    if (now <= last_roll_) {
        return file_ != nullptr;
    }

    FILE* fp = ::fopen(filename.c_str(), "ae"); // 'e' 即 O_CLOEXEC
    if (!fp) {
        fprintf(stderr, "LogFile::rollFile() failed to open %s\n", filename.c_str());
        return file_ != nullptr;
    }
    if (file_) {
        ::fclose(file_);
    }
    file_ = fp;
    written_bytes_ = 0;
    last_roll_ = now;
    last_flush_ = now;
    start_of_period_ = now / kRollPerSeconds_ * kRollPerSeconds_;
    return true;
}

std::string LogFile::getLogFileName(const std::string& basename, time_t* now) {
    std::string filename;
    filename.reserve(basename.size() + 64);
    filename = basename;

    char timebuf[32];
    struct tm tm;
    *now = ::time(nullptr);
    localtime_r(now, &tm);
    strftime(timebuf, sizeof(timebuf), ".%Y%m%d-%H%M%S.", &tm);
    filename += timebuf;
    filename += std::to_string(::getpid());
    filename += ".log";
    return filename;
}
