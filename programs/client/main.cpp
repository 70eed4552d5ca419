//===----------------------------------------------------------------------===//
//                         Surreal CLI
//
// programs/client/main.cpp
//
// Interactive SurrealQL shell over the blocking HTTP RPC connection.
//
// Usage:
//   surreal-cli -u http://localhost:8000 --user root --pass root --ns test --db test
//   surreal-cli -c client.yaml -e "SELECT * FROM person;"
//
// Each statement is sent as one `query` call and the raw per-statement
// results are printed, including statement errors.
//===----------------------------------------------------------------------===//

#include "client/connection.hpp"
#include "config/client_config.hpp"
#include "errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using namespace surreal_client;

static std::string Trim(const std::string &s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static void PrintHelp() {
    std::cout <<
        "\nSurreal CLI\n"
        "\nMeta commands:\n"
        "  .help              Show this message\n"
        "  .quit / .exit      Exit the shell\n"
        "  .use NS DB         Switch namespace and database\n"
        "  .let NAME VALUE    Bind a variable for later queries ($NAME)\n"
        "  .unset NAME        Remove a bound variable\n"
        "  .info              Show info for the signed-in user\n"
        "  .version           Show the server version\n"
        "\nTerminate statements with ';'\n\n";
}

// Literal for .let: true/false, null, NONE, integers, floats, "quoted"
// strings; anything else is taken as a bare string.
static Value ParseLiteral(const std::string &text) {
    if (text == "true") return Value(true);
    if (text == "false") return Value(false);
    if (text == "null") return Value::Null();
    if (text == "NONE") return Value::None();
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        return Value(text.substr(1, text.size() - 2));
    }
    try {
        size_t consumed = 0;
        long long integer = std::stoll(text, &consumed);
        if (consumed == text.size()) return Value(integer);
        double real = std::stod(text, &consumed);
        if (consumed == text.size()) return Value(real);
    } catch (const std::logic_error &) {
        // Not numeric
    }
    return Value(text);
}

static void PrintQueryResult(const Value &payload) {
    if (const Value *error = payload.Find("error")) {
        std::cerr << "Error: " << error->ToString() << "\n";
        return;
    }
    const Value *statements = payload.Find("result");
    if (!statements || !statements->IsArray()) {
        std::cout << payload.ToString() << "\n";
        return;
    }

    for (size_t i = 0; i < statements->Size(); i++) {
        const Value &statement = statements->At(i);
        const Value *status = statement.Find("status");
        const Value *time = statement.Find("time");
        const Value *result = statement.Find("result");

        std::cout << "-- Statement " << (i + 1);
        if (status) std::cout << " [" << (status->IsString() ? status->GetString() : status->ToString()) << "]";
        if (time && time->IsString()) std::cout << " " << time->GetString();
        std::cout << "\n";

        if (status && status->IsString() && status->GetString() == "ERR") {
            std::cerr << "Error: " << (result && result->IsString() ? result->GetString() : "statement failed") << "\n";
        } else {
            std::cout << (result ? result->ToString() : "NONE") << "\n";
        }
    }
    std::cout << "\n";
}

// Meta command; returns false when the shell should exit
static bool RunMetaCommand(BlockingHttpConnection &conn, const std::string &line) {
    std::string command = line;
    std::string rest;
    auto space = line.find_first_of(" \t");
    if (space != std::string::npos) {
        command = line.substr(0, space);
        rest = Trim(line.substr(space));
    }
    std::transform(command.begin(), command.end(), command.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (command == ".quit" || command == ".exit" || command == ".q") {
        return false;
    }
    if (command == ".help" || command == ".h") {
        PrintHelp();
    } else if (command == ".use") {
        auto split = rest.find_first_of(" \t");
        if (split == std::string::npos) {
            std::cerr << "Usage: .use NS DB\n";
        } else {
            std::string ns = rest.substr(0, split);
            std::string db = Trim(rest.substr(split));
            conn.Use(ns, db);
            std::cout << "Using " << ns << "/" << db << "\n";
        }
    } else if (command == ".let") {
        auto split = rest.find_first_of(" \t");
        if (split == std::string::npos) {
            std::cerr << "Usage: .let NAME VALUE\n";
        } else {
            conn.Let(rest.substr(0, split), ParseLiteral(Trim(rest.substr(split))));
        }
    } else if (command == ".unset") {
        if (rest.empty()) {
            std::cerr << "Usage: .unset NAME\n";
        } else {
            conn.Unset(rest);
        }
    } else if (command == ".info") {
        std::cout << conn.Info().ToString() << "\n";
    } else if (command == ".version") {
        std::cout << conn.Version().ToString() << "\n";
    } else {
        std::cerr << "Unknown command: " << command << " (try .help)\n";
    }
    return true;
}

static void Authenticate(BlockingHttpConnection &conn, const ClientConfig &config) {
    if (!config.token.empty()) {
        conn.Authenticate(config.token);
    } else if (config.HasCredentials()) {
        SigninParams params;
        params.username = config.username;
        params.password = config.password;
        if (!config.access.empty()) {
            params.access = config.access;
            if (config.HasScope()) {
                params.namespace_ = config.namespace_;
                params.database = config.database;
            }
        }
        conn.Signin(params);
    }
    if (config.HasScope()) {
        conn.Use(config.namespace_, config.database);
    }
}

int main(int argc, char *argv[]) {
    ClientConfig config;
    try {
        bool show_version = false;
        bool show_help = false;
        config = ParseCommandLine(argc, argv, show_version, show_help);
        if (show_help) {
            PrintUsage(argv[0]);
            return 0;
        }
        if (show_version) {
            std::cout << "surreal-cli " << CLIENT_VERSION << "\n";
            return 0;
        }
    } catch (const ConfigError &e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    std::string error;
    if (!config.Validate(error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    surreal::Logger::Initialize(config.log_file, config.log_level);

    try {
        BlockingHttpConnection conn(config.url, std::chrono::milliseconds(config.timeout_ms));
        Authenticate(conn, config);

        if (!config.execute.empty()) {
            PrintQueryResult(conn.QueryRaw(config.execute));
            surreal::Logger::Shutdown();
            return 0;
        }

        std::cout << "Surreal CLI " << CLIENT_VERSION << " - connected to " << config.url << "\n"
                     "Enter SurrealQL followed by ';'  |  .help for commands  |  .quit to exit\n\n";

        using_history();

        std::string buf;
        bool multiline = false;

        while (true) {
            const char *prompt = multiline ? "   ...> " : "surreal> ";
            char *raw = readline(prompt);
            if (!raw) { std::cout << "\nBye!\n"; break; }

            std::string line(raw);
            free(raw);

            if (Trim(line).empty()) continue;
            add_history(line.c_str());

            try {
                // Meta commands (only at start of a fresh statement)
                if (!multiline && Trim(line).front() == '.') {
                    if (!RunMetaCommand(conn, Trim(line))) {
                        std::cout << "Bye!\n";
                        break;
                    }
                    continue;
                }

                buf += (multiline ? "\n" : "") + line;

                if (Trim(buf).back() != ';') { multiline = true; continue; }
                multiline = false;

                std::string statement = buf;
                buf.clear();
                PrintQueryResult(conn.QueryRaw(statement));
            } catch (const SurrealException &e) {
                std::cerr << "Error: " << e.what() << "\n";
            }
        }
    } catch (const SurrealException &e) {
        std::cerr << "Failed to connect to " << config.url << ": " << e.what() << "\n";
        surreal::Logger::Shutdown();
        return 1;
    }

    surreal::Logger::Shutdown();
    return 0;
}
