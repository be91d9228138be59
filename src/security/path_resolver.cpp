#include "security/path_resolver.h"
#include "http_utils.h"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const char* const kAllowedExtensions[] = {".pdf", ".doc", ".docx", ".txt", ".md"};

// 不存在、不是普通文件（目录、设备、FIFO 等）都算 NotFound；is_regular_file 会跟随符号链接
CheckResult checkRegularFile(const fs::path& candidate){
    std::error_code ec;
    fs::file_status status = fs::status(candidate, ec);
    if(ec || !fs::is_regular_file(status)){
        return CheckResult::reject(Rejection::kNotFound, candidate.string());
    }
    return CheckResult::accept(candidate.string());
}

CheckResult checkContainment(const fs::path& base, const fs::path& candidate){
    std::error_code ec;
    fs::path canonical_base = fs::canonical(base, ec);
    if(ec){
        return CheckResult::reject(Rejection::kNotFound, "base directory: " + ec.message());
    }
    fs::path canonical_file = fs::canonical(candidate, ec);
    if(ec){
        return CheckResult::reject(Rejection::kNotFound, candidate.string() + ": " + ec.message());
    }
    if(!PathResolver::isContained(canonical_base.string(), canonical_file.string())){
        return CheckResult::reject(Rejection::kAccessDenied,
                                   canonical_file.string() + " is outside " + canonical_base.string());
    }
    return CheckResult::accept(canonical_file.string());
}

} // namespace

PathResolver::PathResolver(std::string base_dir) : base_dir_(std::move(base_dir)) {}

CheckResult PathResolver::resolve(const std::string& sanitized) const {
    if(!isAllowedExtension(sanitized)){
        return CheckResult::reject(Rejection::kExtensionNotAllowed, extensionOf(sanitized));
    }
    if(isHiddenWithoutExtension(sanitized)){
        return CheckResult::reject(Rejection::kHiddenFileRejected, sanitized);
    }

    fs::path candidate = fs::path(base_dir_) / sanitized;

    CheckResult regular = checkRegularFile(candidate);
    if(!regular){
        return regular;
    }
    return checkContainment(base_dir_, candidate);
}

bool PathResolver::isAllowedExtension(const std::string& filename){
    std::string ext = extensionOf(filename);
    for(const char* allowed : kAllowedExtensions){
        if(ext == allowed){
            return true;
        }
    }
    return false;
}

std::string PathResolver::extensionOf(const std::string& filename){
    size_t dot = filename.find_last_of("./");
    if(dot == std::string::npos || filename[dot] != '.'){
        return "";
    }
    return HttpUtils::toLower(filename.substr(dot));
}

bool PathResolver::isHiddenWithoutExtension(const std::string& filename){
    if(filename.empty() || filename[0] != '.'){
        return false;
    }
    return extensionOf(filename).empty();
}

bool PathResolver::isContained(const std::string& canonical_base, const std::string& canonical_path){
    if(canonical_path == canonical_base){
        return true;
    }
    std::string prefix = canonical_base;
    if(prefix.empty() || prefix.back() != fs::path::preferred_separator){
        prefix += fs::path::preferred_separator;
    }
    return canonical_path.size() > prefix.size() &&
           canonical_path.compare(0, prefix.size(), prefix) == 0;
}

CheckResult PathResolver::containedRegularFile(const std::string& base_dir, const std::string& relative){
    fs::path rel(relative);
    if(rel.is_absolute()){
        rel = rel.relative_path();
    }
    fs::path candidate = fs::path(base_dir) / rel;
    CheckResult regular = checkRegularFile(candidate);
    if(!regular){
        return regular;
    }
    return checkContainment(base_dir, candidate);
}
