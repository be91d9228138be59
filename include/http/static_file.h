#pragma once
#include "http_request.h"
#include "http_response.h"
#include <string>

// 把一个已经确认安全的文件整个读入响应
class StaticFile{
public:
    // If-Modified-Since 不早于文件修改时间时返回 304，读文件失败返回 500
    // disposition 为空时不设置 Content-Disposition
    // @return: 是否发送了文件内容或 304
    static bool serve(const HttpRequest& req, HttpResponse* resp, const std::string& path,
                      const std::string& content_type, const std::string& disposition = std::string());

    // 根据扩展名推断 Content-Type
    static bool serve(const HttpRequest& req, HttpResponse* resp, const std::string& path);
};
