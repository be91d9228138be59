#pragma once
#include <string>
#include <unordered_map>

// 扩展名到 Content-Type 的映射，扩展名带点且不区分大小写
class MimeTypes{
public:
    static std::string getMimeType(const std::string& extension);
private:
    static const std::unordered_map<std::string, std::string> mime_map_;
};
