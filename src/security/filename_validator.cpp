#include "security/filename_validator.h"
#include "http_utils.h"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace {

const char* const kDangerousPatterns[] = {
    "..", "~/", "/", "\\", ":", "*", "?", "\"", "<", ">", "|"
};

bool isAllowedChar(unsigned char c){
    return std::isalnum(c) || c == '.' || c == '_' || c == '-';
}

} // namespace

CheckResult FilenameValidator::validate(const std::string& raw){
    std::string name;
    if(!decode(raw, &name)){
        return CheckResult::reject(Rejection::kInvalidEncoding, "malformed percent escape");
    }

    size_t bad = findControlCharacter(name);
    if(bad != std::string::npos){
        char detail[64];
        if(name[bad] == '\0'){
            snprintf(detail, sizeof(detail), "null byte at offset %zu", bad);
        }else{
            snprintf(detail, sizeof(detail), "0x%02x at offset %zu",
                     static_cast<unsigned>(static_cast<unsigned char>(name[bad])), bad);
        }
        return CheckResult::reject(Rejection::kControlCharacter, detail);
    }

    if(!hasOnlyAllowedCharacters(name)){
        return CheckResult::reject(Rejection::kInvalidCharacters);
    }

    if(name.size() > kMaxLength){
        return CheckResult::reject(Rejection::kTooLong, std::to_string(name.size()) + " bytes");
    }

    const char* pattern = findDangerousPattern(name);
    if(pattern){
        return CheckResult::reject(Rejection::kDangerousPattern, pattern);
    }

    std::string clean = baseName(name);
    if(clean.empty() || clean == "." || clean == ".." || clean.find('/') != std::string::npos){
        return CheckResult::reject(Rejection::kInvalidAfterSanitization, clean);
    }
    return CheckResult::accept(clean);
}

bool FilenameValidator::decode(const std::string& raw, std::string* decoded){
    return HttpUtils::queryUnescape(raw, decoded);
}

size_t FilenameValidator::findControlCharacter(const std::string& name){
    for(size_t i = 0; i < name.size(); ++i){
        unsigned char c = static_cast<unsigned char>(name[i]);
        if(c < 32 && c != '\t' && c != '\n' && c != '\r'){
            return i;
        }
    }
    return std::string::npos;
}

bool FilenameValidator::hasOnlyAllowedCharacters(const std::string& name){
    if(name.empty()){
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c){
        return isAllowedChar(static_cast<unsigned char>(c));
    });
}

const char* FilenameValidator::findDangerousPattern(const std::string& name){
    std::string lower = HttpUtils::toLower(name);
    for(const char* pattern : kDangerousPatterns){
        if(lower.find(pattern) != std::string::npos){
            return pattern;
        }
    }
    return nullptr;
}

std::string FilenameValidator::baseName(const std::string& name){
    if(name.empty()){
        return ".";
    }
    size_t last = name.find_last_not_of('/');
    if(last == std::string::npos){
        return "/";
    }
    size_t slash = name.rfind('/', last);
    if(slash == std::string::npos){
        return name.substr(0, last + 1);
    }
    return name.substr(slash + 1, last - slash);
}
