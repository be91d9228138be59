#pragma once
#include <cstdint>
#include <ctime>
#include <string>

// 微秒精度的时间点，日志、定时器和 Last-Modified 共用
class Timestamp{
public:
    Timestamp() : micro_seconds_since_epoch_(0) {}
    explicit Timestamp(int64_t micro_seconds) : micro_seconds_since_epoch_(micro_seconds){}

    static Timestamp now();
    static Timestamp fromUnixTime(time_t seconds) {
        return Timestamp(static_cast<int64_t>(seconds) * kMicroSecondsPerSecond);
    }

    // 本地时间，日志行使用 "2024/01/31 12:00:00.000123"
    std::string toString() const;

    // RFC 1123 格式，例如 "Sun, 06 Nov 1994 08:49:37 GMT"
    std::string toHttpDate() const;
    // 解析失败返回无效时间戳
    static Timestamp fromHttpDate(const std::string& text);

    bool valid() const { return micro_seconds_since_epoch_ > 0; }
    int64_t microSecondSinceEpoch() const { return micro_seconds_since_epoch_; }
    time_t secondsSinceEpoch() const {
        return static_cast<time_t>(micro_seconds_since_epoch_ / kMicroSecondsPerSecond);
    }
    static const int kMicroSecondsPerSecond = 1000 * 1000;
private:
    int64_t micro_seconds_since_epoch_;
};

inline bool operator<(Timestamp lhs, Timestamp rhs){
    return lhs.microSecondSinceEpoch() < rhs.microSecondSinceEpoch();
}

inline bool operator==(Timestamp lhs, Timestamp rhs){
    return lhs.microSecondSinceEpoch() == rhs.microSecondSinceEpoch();
}

inline Timestamp addTime(Timestamp timestamp, double seconds){
    int64_t delta = static_cast<int64_t>(seconds * Timestamp::kMicroSecondsPerSecond);
    return Timestamp(timestamp.microSecondSinceEpoch() + delta);
}
