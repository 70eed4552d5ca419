//===----------------------------------------------------------------------===//
//                         Surreal Client
//
// config/client_config.hpp
//
// Client configuration
//===----------------------------------------------------------------------===//

#pragma once

#include "client/url.hpp"
#include "common.hpp"
#include "config/config_file.hpp"
#include "config/yaml_config.hpp"
#include "errors.hpp"
#include <string>
#include <iostream>
#include <algorithm>
#include <cctype>

namespace surreal_client {

struct ClientConfig {
    // Connection
    std::string url = DEFAULT_URL;
    std::string namespace_;
    std::string database;
    uint32_t timeout_ms = DEFAULT_REQUEST_TIMEOUT_MS;

    // Credentials; signin is attempted when username is set
    std::string username;
    std::string password;
    std::string access;
    std::string token;

    // Logging
    std::string log_file;
    std::string log_level = "info";

    // One-shot statement (-e); empty means interactive
    std::string execute;

    std::string config_file;

    bool HasCredentials() const { return !username.empty(); }
    bool HasScope() const { return !namespace_.empty() && !database.empty(); }

    bool Validate(std::string& error) const {
        try {
            Url endpoint = Url::Parse(url);
            if (endpoint.GetScheme() != UrlScheme::HTTP) {
                error = "Only http:// endpoints are supported: " + url;
                return false;
            }
        } catch (const ConfigError& e) {
            error = e.what();
            return false;
        }
        if (timeout_ms == 0) {
            error = "Timeout must be greater than 0";
            return false;
        }
        if (namespace_.empty() != database.empty()) {
            error = "Namespace and database must be given together";
            return false;
        }
        if (!token.empty() && HasCredentials()) {
            error = "Give either a token or a username, not both";
            return false;
        }
        return true;
    }

    // Load from config file (format chosen by extension)
    bool LoadFromFile(const std::string& path, std::string& error) {
        std::string ext;
        auto dot_pos = path.rfind('.');
        if (dot_pos != std::string::npos) {
            ext = path.substr(dot_pos);
            std::transform(ext.begin(), ext.end(), ext.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        }

        if (ext == ".yaml" || ext == ".yml") {
            return LoadFromYaml(path, error);
        }
        return LoadFromIni(path, error);
    }

    bool LoadFromIni(const std::string& path, std::string& error) {
        ConfigFile cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }
        return Apply(cfg, error);
    }

    bool LoadFromYaml(const std::string& path, std::string& error) {
        YamlConfig cfg;
        if (!cfg.Load(path)) {
            error = cfg.GetError();
            return false;
        }
        if (!Apply(cfg, error)) {
            return false;
        }
        if (!cfg.GetError().empty()) {
            error = cfg.GetError();
            return false;
        }
        return true;
    }

    // Both file formats expose the same dotted keys
    template<typename Source>
    bool Apply(const Source& cfg, std::string& error) {
        // Connection section
        if (cfg.Has("connection.url")) url = cfg.GetString("connection.url");
        if (cfg.Has("connection.namespace")) namespace_ = cfg.GetString("connection.namespace");
        if (cfg.Has("connection.database")) database = cfg.GetString("connection.database");
        if (cfg.Has("connection.timeout_ms")) {
            int64_t value = cfg.GetInt64("connection.timeout_ms", -1);
            if (value <= 0 || value > UINT32_MAX) {
                error = "connection.timeout_ms must be a positive number of milliseconds";
                return false;
            }
            timeout_ms = static_cast<uint32_t>(value);
        }

        // Auth section
        if (cfg.Has("auth.username")) username = cfg.GetString("auth.username");
        if (cfg.Has("auth.password")) password = cfg.GetString("auth.password");
        if (cfg.Has("auth.access")) access = cfg.GetString("auth.access");
        if (cfg.Has("auth.token")) token = cfg.GetString("auth.token");

        // Logging section
        if (cfg.Has("logging.file")) log_file = cfg.GetString("logging.file");
        if (cfg.Has("logging.level")) log_level = cfg.GetString("logging.level");

        return true;
    }
};

inline void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>     Config file path (.yaml, .yml or key = value)\n"
              << "  -u, --url <url>         Server URL (default: " << DEFAULT_URL << ")\n"
              << "  --ns <name>             Namespace to use\n"
              << "  --db <name>             Database to use\n"
              << "  --user <name>           Sign in as this user\n"
              << "  --pass <password>       Password for --user\n"
              << "  --access <method>       Access method for record users\n"
              << "  --token <jwt>           Authenticate with an existing token\n"
              << "  --timeout <ms>          Request timeout in milliseconds (default: "
              << DEFAULT_REQUEST_TIMEOUT_MS << ")\n"
              << "  -e, --execute <query>   Run one statement and exit\n"
              << "  --log-file <path>       Log file path\n"
              << "  --log-level <level>     Log level (trace, debug, info, warn, error, off)\n"
              << "  --version               Show version info\n"
              << "  --help                  Show this help\n";
}

// Config file first (-c), then flags on top. Throws ConfigError on a
// missing argument, an unknown flag, a bad number or an unreadable file.
inline ClientConfig ParseCommandLine(int argc, char* argv[], bool& show_version, bool& show_help) {
    ClientConfig config;
    show_version = false;
    show_help = false;
    std::string config_file_path;

    // First pass: look for config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            config_file_path = argv[++i];
        }
    }

    if (!config_file_path.empty()) {
        std::string error;
        if (!config.LoadFromFile(config_file_path, error)) {
            throw ConfigError("Error loading config file: " + error);
        }
        config.config_file = config_file_path;
    }

    auto next = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw ConfigError("Missing value for " + flag);
        }
        return argv[++i];
    };

    // Second pass: command line overrides config file
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            show_help = true;
        } else if (arg == "--version") {
            show_version = true;
        } else if (arg == "-c" || arg == "--config") {
            next(i, arg);  // Already processed
        } else if (arg == "-u" || arg == "--url") {
            config.url = next(i, arg);
        } else if (arg == "--ns") {
            config.namespace_ = next(i, arg);
        } else if (arg == "--db") {
            config.database = next(i, arg);
        } else if (arg == "--user") {
            config.username = next(i, arg);
        } else if (arg == "--pass") {
            config.password = next(i, arg);
        } else if (arg == "--access") {
            config.access = next(i, arg);
        } else if (arg == "--token") {
            config.token = next(i, arg);
        } else if (arg == "--timeout") {
            std::string value = next(i, arg);
            try {
                size_t consumed = 0;
                long long parsed = std::stoll(value, &consumed);
                if (consumed != value.size() || parsed <= 0 || parsed > UINT32_MAX) {
                    throw ConfigError("Invalid timeout: " + value);
                }
                config.timeout_ms = static_cast<uint32_t>(parsed);
            } catch (const std::logic_error&) {
                throw ConfigError("Invalid timeout: " + value);
            }
        } else if (arg == "-e" || arg == "--execute") {
            config.execute = next(i, arg);
        } else if (arg == "--log-file") {
            config.log_file = next(i, arg);
        } else if (arg == "--log-level") {
            config.log_level = next(i, arg);
        } else {
            throw ConfigError("Unknown option: " + arg);
        }
    }

    return config;
}

} // namespace surreal_client
