#pragma once

// fd、线程、日志文件等唯一资源的持有者都不允许被复制
class NonCopyable{
protected:
    NonCopyable() = default;
    ~NonCopyable() = default;
public:
    NonCopyable(const NonCopyable&) = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
};
