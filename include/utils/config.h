#pragma once
#include "utils/noncopyable.h"
#include <istream>
#include <map>
#include <string>

// key=value 配置文件解析器
// 兼容 .properties 和 INI：[section] 下的 key 以 "section.key" 保存
class Config : NonCopyable {
public:
    Config() = default;
    ~Config() = default;

    // 文件不存在或无法打开时返回 false，已有内容保持不变
    bool load(const std::string& filename);
    void parse(std::istream& in);

    std::string getString(const std::string& key, const std::string& default_value = "") const;
    // 无法解析为整数时返回默认值并打印告警
    int getInt(const std::string& key, int default_value = 0) const;
    // "true"/"yes"/"on"/"1" 与 "false"/"no"/"off"/"0"，不区分大小写
    bool getBool(const std::string& key, bool default_value = false) const;

    bool hasKey(const std::string& key) const;
    size_t size() const { return data_.size(); }

private:
    static std::string trim(const std::string& str);

    std::map<std::string, std::string> data_;
};
