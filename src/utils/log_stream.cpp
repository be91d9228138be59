#include "utils/log_stream.h"
#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <sstream>

namespace {

const char kDigits[] = "9876543210123456789";
const char* const kZero = kDigits + 9;
const char kDigitsHex[] = "0123456789abcdef";

// 从低位向高位写入再翻转，负数依靠 kZero 两侧对称的表处理
template<typename T>
size_t convert(char buf[], T value) {
    T i = value;
    char* p = buf;
    do {
        int lsd = static_cast<int>(i % 10);
        i /= 10;
        *p++ = kZero[lsd];
    } while (i != 0);
    if (value < 0) {
        *p++ = '-';
    }
    *p = '\0';
    std::reverse(buf, p);
    return p - buf;
}

size_t convertHex(char buf[], uintptr_t value) {
    uintptr_t i = value;
    char* p = buf;
    do {
        *p++ = kDigitsHex[i % 16];
        i /= 16;
    } while (i != 0);
    *p = '\0';
    std::reverse(buf, p);
    return p - buf;
}

} // namespace

template<typename T>
void LogStream::formatInteger(T v) {
    if (buffer_.avail() >= kMaxNumericSize) {
        size_t len = convert(buffer_.current(), v);
        buffer_.add(len);
    }
}

LogStream& LogStream::operator<<(short v) {
    return *this << static_cast<int>(v);
}

LogStream& LogStream::operator<<(unsigned short v) {
    return *this << static_cast<unsigned int>(v);
}

LogStream& LogStream::operator<<(int v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(unsigned int v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(long v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(unsigned long v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(long long v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(unsigned long long v) {
    formatInteger(v);
    return *this;
}

LogStream& LogStream::operator<<(const void* p) {
    uintptr_t v = reinterpret_cast<uintptr_t>(p);
    if (buffer_.avail() >= kMaxNumericSize) {
        char* buf = buffer_.current();
        buf[0] = '0';
        buf[1] = 'x';
        size_t len = convertHex(buf + 2, v);
        buffer_.add(len + 2);
    }
    return *this;
}

LogStream& LogStream::operator<<(double v) {
    if (buffer_.avail() >= kMaxNumericSize) {
        int len = snprintf(buffer_.current(), kMaxNumericSize, "%.12g", v);
        buffer_.add(len);
    }
    return *this;
}

LogStream& LogStream::operator<<(const std::thread::id& tid) {
    std::ostringstream ss;
    ss << tid;
    const std::string s = ss.str();
    buffer_.append(s.data(), s.size());
    return *this;
}
