#pragma once
#include "security/check_result.h"
#include <string>

// 不可信文件名的校验，纯函数，不做任何 I/O
//
// 顺序固定且只解码一次：解码 -> 控制字符 -> 字符白名单 -> 长度 -> 危险子串 -> 取 basename。
// 先解码再校验，双重编码的 "%252e%252e" 解码一次后仍含 '%'，会被白名单拦下。
// 白名单已经排除了路径分隔符，危险子串和 basename 两步是有意保留的冗余防线，
// 放宽白名单时不能让它们跟着失效。
class FilenameValidator{
public:
    static const size_t kMaxLength = 255;

    // 成功时 value() 是可以与基目录拼接的文件名
    static CheckResult validate(const std::string& raw);

    // 按查询串规则解码一次（'+' 为空格，'%' 后必须是两个十六进制数字）
    static bool decode(const std::string& raw, std::string* decoded);

    // NUL 以及除 \t \n \r 以外小于 32 的字节，返回其下标，没有则返回 npos
    static size_t findControlCharacter(const std::string& name);

    // 非空且只包含 [A-Za-z0-9._-]
    static bool hasOnlyAllowedCharacters(const std::string& name);

    // 不区分大小写地查找危险子串，返回命中的模式，没有则返回 nullptr
    static const char* findDangerousPattern(const std::string& name);

    // 最后一个路径分量，空串返回 "."
    static std::string baseName(const std::string& name);
};
