#include "http_utils.h"
#include <algorithm>
#include <cctype>

namespace HttpUtils {

namespace {

int hexValue(char c){
    if(c >= '0' && c <= '9') return c - '0';
    if(c >= 'a' && c <= 'f') return c - 'a' + 10;
    if(c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

const char kBearerScheme[] = "bearer";
const size_t kBearerSchemeLen = sizeof(kBearerScheme) - 1;

bool unescape(const std::string& in, std::string* out, bool plus_is_space){
    std::string result;
    result.reserve(in.size());
    for(size_t i = 0; i < in.size(); ++i){
        char c = in[i];
        if(c == '%'){
            if(i + 2 >= in.size()){
                return false;
            }
            int hi = hexValue(in[i + 1]);
            int lo = hexValue(in[i + 2]);
            if(hi < 0 || lo < 0){
                return false;
            }
            result += static_cast<char>((hi << 4) | lo);
            i += 2;
        }else if(c == '+' && plus_is_space){
            result += ' ';
        }else{
            result += c;
        }
    }
    out->swap(result);
    return true;
}

} // namespace

bool queryUnescape(const std::string& in, std::string* out){
    return unescape(in, out, true);
}

bool pathUnescape(const std::string& in, std::string* out){
    return unescape(in, out, false);
}

std::string toLower(const std::string& str){
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){
        return static_cast<char>(std::tolower(c));
    });
    return lower;
}

bool iequals(const std::string& a, const std::string& b){
    return a.size() == b.size() && toLower(a) == toLower(b);
}

std::string trim(const std::string& str){
    const std::string whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if(first == std::string::npos) return "";
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

std::string escapeForHeader(const std::string& str){
    std::string escaped;
    escaped.reserve(str.size());
    for(char c : str){
        if(c == '"' || c == '\\'){
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

std::string attachmentDisposition(const std::string& filename){
    return "attachment; filename=\"" + escapeForHeader(filename) + "\"";
}

std::optional<std::string> extractBearerToken(const std::string& authorization){
    std::string value = trim(authorization);
    if(value.size() <= kBearerSchemeLen){
        return std::nullopt;
    }
    if(!iequals(value.substr(0, kBearerSchemeLen), kBearerScheme)){
        return std::nullopt;
    }
    // scheme 后至少一个空格
    if(value[kBearerSchemeLen] != ' ' && value[kBearerSchemeLen] != '\t'){
        return std::nullopt;
    }
    std::string token = trim(value.substr(kBearerSchemeLen));
    if(token.empty()){
        return std::nullopt;
    }
    return token;
}

} // namespace HttpUtils
