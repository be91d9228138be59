#pragma once
#include <string>
#include <utility>

// 校验管线的拒绝原因，只用于服务端日志，客户端只会看到笼统的 404/401
enum class Rejection {
    kNone,
    kInvalidEncoding,
    kControlCharacter,
    kInvalidCharacters,
    kTooLong,
    kDangerousPattern,
    kInvalidAfterSanitization,
    kExtensionNotAllowed,
    kHiddenFileRejected,
    kNotFound,
    kAccessDenied,
    kUnauthorized,
};

const char* rejectionName(Rejection reason);

// 要么携带结果值，要么携带拒绝原因和细节（匹配到的模式、扩展名等）
class CheckResult{
public:
    static CheckResult accept(std::string value) {
        return CheckResult(Rejection::kNone, std::move(value), std::string());
    }
    static CheckResult reject(Rejection reason, std::string detail = std::string()) {
        return CheckResult(reason, std::string(), std::move(detail));
    }

    bool ok() const { return reason_ == Rejection::kNone; }
    explicit operator bool() const { return ok(); }

    const std::string& value() const { return value_; }
    Rejection reason() const { return reason_; }
    const std::string& detail() const { return detail_; }

    // "DangerousPattern: .." 这样的日志文本
    std::string describe() const;

private:
    CheckResult(Rejection reason, std::string value, std::string detail)
        : reason_(reason), value_(std::move(value)), detail_(std::move(detail)) {}

    Rejection reason_;
    std::string value_;
    std::string detail_;
};
