#include "service/user_guide_service.h"
#include "security/filename_validator.h"
#include <utility>

UserGuideService::UserGuideService(std::string base_dir, std::string user_guide_file)
    : resolver_(std::move(base_dir)), user_guide_file_(std::move(user_guide_file)) {}

CheckResult UserGuideService::locateUserGuide(std::string* sanitized_name) const {
    CheckResult name = FilenameValidator::validate(user_guide_file_);
    if(!name){
        return name;
    }
    CheckResult resolved = resolver_.resolve(name.value());
    if(resolved && sanitized_name){
        *sanitized_name = name.value();
    }
    return resolved;
}
