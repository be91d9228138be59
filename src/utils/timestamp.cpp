#include "utils/timestamp.h"
#include <sys/time.h>
#include <cstdio>
#include <cstring>

Timestamp Timestamp::now(){
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return Timestamp(static_cast<int64_t>(tv.tv_sec) * kMicroSecondsPerSecond + tv.tv_usec);
}

std::string Timestamp::toString() const {
    char buf[64] = {0};
    time_t seconds = secondsSinceEpoch();
    long micro_seconds = static_cast<long>(micro_seconds_since_epoch_ % kMicroSecondsPerSecond);

    struct tm tm_time;
    localtime_r(&seconds, &tm_time);

    snprintf(buf, sizeof(buf), "%4d/%02d/%02d %02d:%02d:%02d.%06ld",
        tm_time.tm_year + 1900, tm_time.tm_mon + 1, tm_time.tm_mday,
        tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec, micro_seconds);
    return buf;
}

std::string Timestamp::toHttpDate() const {
    char buf[64] = {0};
    time_t seconds = secondsSinceEpoch();
    struct tm tm_time;
    gmtime_r(&seconds, &tm_time);
    // strftime 的 %a/%b 受 locale 影响，HTTP 日期要求固定英文
    static const char* const kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    snprintf(buf, sizeof(buf), "%s, %02d %s %4d %02d:%02d:%02d GMT",
        kDays[tm_time.tm_wday], tm_time.tm_mday, kMonths[tm_time.tm_mon],
        tm_time.tm_year + 1900, tm_time.tm_hour, tm_time.tm_min, tm_time.tm_sec);
    return buf;
}

Timestamp Timestamp::fromHttpDate(const std::string& text){
    static const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    char weekday[4] = {0};
    char month[4] = {0};
    char zone[4] = {0};
    struct tm tm_time;
    memset(&tm_time, 0, sizeof(tm_time));

    int n = sscanf(text.c_str(), "%3s, %d %3s %d %d:%d:%d %3s",
                   weekday, &tm_time.tm_mday, month, &tm_time.tm_year,
                   &tm_time.tm_hour, &tm_time.tm_min, &tm_time.tm_sec, zone);
    if(n != 8 || strcmp(zone, "GMT") != 0){
        return Timestamp();
    }
    tm_time.tm_mon = -1;
    for(int i = 0; i < 12; ++i){
        if(strcmp(month, kMonths[i]) == 0){
            tm_time.tm_mon = i;
            break;
        }
    }
    if(tm_time.tm_mon < 0){
        return Timestamp();
    }
    tm_time.tm_year -= 1900;
    time_t seconds = timegm(&tm_time);
    if(seconds <= 0){
        return Timestamp();
    }
    return fromUnixTime(seconds);
}
