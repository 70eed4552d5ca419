//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// config/yaml_config.hpp
//
// YAML configuration file addressed by dotted paths ("connection.url")
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

namespace surreal_client {

class YamlConfig {
public:
    bool Load(const std::string& path) {
        try {
            root_ = YAML::LoadFile(path);
        } catch (const YAML::BadFile&) {
            error_ = "Cannot open config file: " + path;
            return false;
        } catch (const YAML::Exception& e) {
            error_ = "YAML parse error in " + path + ": " + e.what();
            return false;
        }
        return CheckRoot();
    }

    bool LoadString(const std::string& text) {
        try {
            root_ = YAML::Load(text);
        } catch (const YAML::Exception& e) {
            error_ = std::string("YAML parse error: ") + e.what();
            return false;
        }
        return CheckRoot();
    }

    // Scalar at `path` or `default_val` when absent. A value that does not
    // convert to T records an error and yields the default.
    template<typename T>
    T Get(const std::string& path, const T& default_val) const {
        YAML::Node node = Lookup(path);
        if (!node || node.IsNull()) {
            return default_val;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            error_ = "Invalid value for " + path;
            return default_val;
        }
    }

    std::string GetString(const std::string& path, const std::string& default_val = "") const {
        return Get<std::string>(path, default_val);
    }

    int64_t GetInt64(const std::string& path, int64_t default_val = 0) const {
        return Get<int64_t>(path, default_val);
    }

    bool Has(const std::string& path) const {
        YAML::Node node = Lookup(path);
        return node && !node.IsNull();
    }

    const std::string& GetError() const { return error_; }

private:
    bool CheckRoot() {
        if (root_ && !root_.IsNull() && !root_.IsMap()) {
            error_ = "YAML config must be a mapping";
            return false;
        }
        return true;
    }

    // Walks "a.b.c" without mutating the tree (operator[] on a non-const
    // node inserts missing keys).
    YAML::Node Lookup(const std::string& path) const {
        YAML::Node current = YAML::Clone(root_);
        size_t start = 0;
        while (true) {
            if (!current.IsMap()) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            size_t end = path.find('.', start);
            std::string key = path.substr(start, end == std::string::npos ? std::string::npos : end - start);
            const YAML::Node& parent = current;
            YAML::Node child = parent[key];
            if (!child) {
                return YAML::Node(YAML::NodeType::Undefined);
            }
            if (end == std::string::npos) {
                return child;
            }
            current.reset(child);
            start = end + 1;
        }
    }

    YAML::Node root_;
    mutable std::string error_;
};

} // namespace surreal_client
