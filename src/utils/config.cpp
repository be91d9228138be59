#include "utils/config.h"
#include "utils/logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

bool Config::load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }
    data_.clear();
    parse(file);
    return true;
}

void Config::parse(std::istream& in) {
    std::string line;
    std::string current_section;

    while (std::getline(in, line)) {
        line = trim(line);

        // 忽略空行和注释
        if (line.empty() || line[0] == ';' || line[0] == '#') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // 没有 '=' 的行直接跳过
        size_t delimiter_pos = line.find('=');
        if (delimiter_pos == std::string::npos) {
            continue;
        }
        std::string key = trim(line.substr(0, delimiter_pos));
        std::string value = trim(line.substr(delimiter_pos + 1));
        if (key.empty()) {
            continue;
        }
        if (!current_section.empty()) {
            key = current_section + "." + key;
        }
        data_[key] = value;
    }
}

std::string Config::getString(const std::string& key, const std::string& default_value) const {
    auto it = data_.find(key);
    return it == data_.end() ? default_value : it->second;
}

int Config::getInt(const std::string& key, int default_value) const {
    auto it = data_.find(key);
    if (it == data_.end() || it->second.empty()) {
        return default_value;
    }
    try {
        size_t consumed = 0;
        int value = std::stoi(it->second, &consumed);
        if (consumed != it->second.size()) {
            throw std::invalid_argument(it->second);
        }
        return value;
    } catch (const std::invalid_argument&) {
        LOG_WARN << "Config: '" << key << "' is not an integer: " << it->second;
    } catch (const std::out_of_range&) {
        LOG_WARN << "Config: '" << key << "' is out of range: " << it->second;
    }
    return default_value;
}

bool Config::getBool(const std::string& key, bool default_value) const {
    std::string value_str = getString(key);
    if (value_str.empty()) {
        return default_value;
    }
    std::transform(value_str.begin(), value_str.end(), value_str.begin(),
                   [](unsigned char c){ return static_cast<char>(::tolower(c)); });
    if (value_str == "true" || value_str == "yes" || value_str == "on" || value_str == "1") {
        return true;
    }
    if (value_str == "false" || value_str == "no" || value_str == "off" || value_str == "0") {
        return false;
    }
    LOG_WARN << "Config: '" << key << "' is not a boolean: " << value_str;
    return default_value;
}

bool Config::hasKey(const std::string& key) const {
    return data_.find(key) != data_.end();
}

std::string Config::trim(const std::string& str) {
    const std::string whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, (last - first + 1));
}
