#pragma once
#include "security/check_result.h"
#include <string>

// 把已校验的文件名与基目录拼接，确认结果是基目录内真实存在的普通文件
//
// 包含关系用 canonical（解析符号链接后）的路径比较，
// 基目录里指向外部的符号链接因此会被拒绝。
class PathResolver{
public:
    explicit PathResolver(std::string base_dir);

    // 成功时 value() 是文件的 canonical 绝对路径
    CheckResult resolve(const std::string& sanitized) const;

    const std::string& baseDir() const { return base_dir_; }

    // 白名单：.pdf .doc .docx .txt .md，不区分大小写
    static bool isAllowedExtension(const std::string& filename);

    // 从最后一个 '.' 开始的后缀，小写，没有则为空串
    static std::string extensionOf(const std::string& filename);

    // 以 '.' 开头且整个名字没有扩展名；".pdf"、".bashrc" 的扩展名就是整个名字，不算
    static bool isHiddenWithoutExtension(const std::string& filename);

    // 两个参数都必须是 canonical 路径
    static bool isContained(const std::string& canonical_base, const std::string& canonical_path);

    // 不经过文件名校验，只检查存在性和包含关系，供运维可信的静态目录使用
    static CheckResult containedRegularFile(const std::string& base_dir, const std::string& relative);

private:
    std::string base_dir_;
};
