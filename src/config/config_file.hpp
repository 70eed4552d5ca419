//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// config/config_file.hpp
//
// INI-style configuration file (key = value, optional [section] headers)
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <fstream>
#include <algorithm>

namespace surreal_client {

// Keys below a "[section]" header are stored as "section.key", so an INI file
// and a YAML file address the same settings with the same dotted paths.
class ConfigFile {
public:
    bool Load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            error_ = "Cannot open config file: " + path;
            return false;
        }
        return Parse(file, path);
    }

    bool Parse(std::istream& input, const std::string& source = "<input>") {
        values_.clear();
        std::string section;
        std::string line;
        int line_num = 0;

        while (std::getline(input, line)) {
            line_num++;
            Trim(line);
            if (line.empty() || line[0] == '#' || line[0] == ';') {
                continue;
            }

            if (line.front() == '[') {
                if (line.back() != ']' || line.size() < 3) {
                    error_ = source + ":" + std::to_string(line_num) + ": malformed section header";
                    return false;
                }
                section = line.substr(1, line.size() - 2);
                Trim(section);
                continue;
            }

            auto eq_pos = line.find('=');
            if (eq_pos == std::string::npos) {
                error_ = source + ":" + std::to_string(line_num) + ": expected key = value";
                return false;
            }

            std::string key = line.substr(0, eq_pos);
            std::string value = line.substr(eq_pos + 1);
            Trim(key);
            Trim(value);
            if (key.empty()) {
                error_ = source + ":" + std::to_string(line_num) + ": empty key";
                return false;
            }

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            values_[section.empty() ? key : section + "." + key] = value;
        }

        return true;
    }

    std::string GetString(const std::string& key, const std::string& default_val = "") const {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_val;
    }

    int64_t GetInt64(const std::string& key, int64_t default_val = 0) const {
        auto it = values_.find(key);
        if (it == values_.end()) return default_val;
        try {
            size_t consumed = 0;
            int64_t parsed = std::stoll(it->second, &consumed);
            return consumed == it->second.size() ? parsed : default_val;
        } catch (const std::exception&) {
            return default_val;
        }
    }

    bool Has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    size_t Size() const { return values_.size(); }

    const std::string& GetError() const { return error_; }

private:
    static void Trim(std::string& text) {
        text.erase(0, text.find_first_not_of(" \t\r"));
        text.erase(text.find_last_not_of(" \t\r") + 1);
    }

    std::unordered_map<std::string, std::string> values_;
    std::string error_;
};

} // namespace surreal_client
