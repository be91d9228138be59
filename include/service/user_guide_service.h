#pragma once
#include "security/check_result.h"
#include "security/path_resolver.h"
#include <string>

// 把配置中的文件名走一遍完整的校验管线，得到可以直接发送的文件路径
// 无状态，多个工作线程可以同时调用
class UserGuideService{
public:
    UserGuideService(std::string base_dir, std::string user_guide_file);

    // 成功时 value() 为 canonical 路径，失败时带拒绝原因
    // sanitized_name 非空时写入校验后的文件名，响应头只能由它推导，不能用符号链接的目标
    CheckResult locateUserGuide(std::string* sanitized_name = nullptr) const;

    const std::string& configuredFile() const { return user_guide_file_; }
    const std::string& baseDir() const { return resolver_.baseDir(); }

private:
    PathResolver resolver_;
    const std::string user_guide_file_;
};
