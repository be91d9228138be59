#include "security/check_result.h"

const char* rejectionName(Rejection reason){
    switch(reason){
        case Rejection::kNone: return "None";
        case Rejection::kInvalidEncoding: return "InvalidEncoding";
        case Rejection::kControlCharacter: return "ControlCharacter";
        case Rejection::kInvalidCharacters: return "InvalidCharacters";
        case Rejection::kTooLong: return "TooLong";
        case Rejection::kDangerousPattern: return "DangerousPattern";
        case Rejection::kInvalidAfterSanitization: return "InvalidAfterSanitization";
        case Rejection::kExtensionNotAllowed: return "ExtensionNotAllowed";
        case Rejection::kHiddenFileRejected: return "HiddenFileRejected";
        case Rejection::kNotFound: return "NotFound";
        case Rejection::kAccessDenied: return "AccessDenied";
        case Rejection::kUnauthorized: return "Unauthorized";
    }
    return "Unknown";
}

std::string CheckResult::describe() const {
    if(ok()){
        return "OK: " + value_;
    }
    std::string text = rejectionName(reason_);
    if(!detail_.empty()){
        text += ": ";
        text += detail_;
    }
    return text;
}
