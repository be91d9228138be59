#include "mime_types.h"
#include "http_utils.h"

const std::unordered_map<std::string, std::string> MimeTypes::mime_map_ = {
    // 文档
    {".pdf", "application/pdf"},
    {".doc", "application/msword"},
    {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {".txt", "text/plain; charset=utf-8"},
    {".md", "text/markdown; charset=utf-8"},
    // 静态页面资源
    {".html", "text/html; charset=utf-8"},
    {".htm", "text/html; charset=utf-8"},
    {".css", "text/css"},
    {".js", "application/javascript"},
    {".json", "application/json"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".ico", "image/x-icon"},
};

std::string MimeTypes::getMimeType(const std::string& extension){
    auto it = mime_map_.find(HttpUtils::toLower(extension));
    if(it != mime_map_.end()){
        return it->second;
    }
    return "application/octet-stream";
}
