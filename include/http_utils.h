#pragma once
#include <optional>
#include <string>

namespace HttpUtils{
    // 严格的 URL 查询串解码：'+' 解码为空格，'%' 后必须跟两位十六进制数字
    // 格式错误时返回 false，*out 内容未定义
    bool queryUnescape(const std::string& in, std::string* out);
    // URL 路径解码，与 queryUnescape 相同但 '+' 保持原样
    bool pathUnescape(const std::string& in, std::string* out);

    // 只对 ASCII 字母生效
    std::string toLower(const std::string& str);
    bool iequals(const std::string& a, const std::string& b);
    std::string trim(const std::string& str);

    // 用于 quoted-string 头部值，转义双引号和反斜杠
    std::string escapeForHeader(const std::string& str);
    // attachment; filename="<escaped>"
    std::string attachmentDisposition(const std::string& filename);

    // 从 Authorization 头中取出 Bearer 令牌，scheme 不区分大小写
    std::optional<std::string> extractBearerToken(const std::string& authorization);
}
