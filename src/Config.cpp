#include "Config.hpp"
#include "Grammar.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace sqlquery {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

int64_t parseInteger(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        long long result = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid value for '" + key + "': " + value);
    }
}

uint16_t parsePort(const std::string& key, const std::string& value) {
    int64_t port = parseInteger(key, value);
    if (port < 0 || port > 65535) {
        throw std::runtime_error("Invalid value for '" + key + "': " + value);
    }
    return static_cast<uint16_t>(port);
}

void applyConnectionKey(ConnectionConfig& conn, const std::string& key, const std::string& value) {
    if (key == "driver") conn.driver = value;
    else if (key == "host") conn.host = value;
    else if (key == "port") conn.port = parsePort(key, value);
    else if (key == "database") conn.database = value;
    else if (key == "username" || key == "user") conn.username = value;
    else if (key == "password") conn.password = value;
    else if (key == "sslmode") conn.sslmode = value;
    else if (key == "ssl_ca") conn.ssl_ca = value;
    else if (key == "ssl_cert") conn.ssl_cert = value;
    else if (key == "ssl_key") conn.ssl_key = value;
    else if (key == "connect_timeout")
        conn.connect_timeout = std::chrono::milliseconds(parseInteger(key, value));
    else if (key == "foreign_keys" || key == "foreign_key_constraints")
        conn.foreign_keys = parseBool(value);
    else
        spdlog::warn("Unknown connection option '{}'", key);
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header; "connection.<name>" keeps the case of <name>
        if (line[0] == '[' && line.back() == ']') {
            std::string section = trim(line.substr(1, line.size() - 2));
            auto dot = section.find('.');
            if (dot == std::string::npos) {
                current_section = toLower(section);
            } else {
                current_section = toLower(section.substr(0, dot)) + section.substr(dot);
            }
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        // Apply to appropriate section
        if (current_section == "database") {
            if (key == "default") config.database.default_connection = value;
        }
        else if (current_section.rfind("connection.", 0) == 0) {
            std::string name = current_section.substr(std::string("connection.").size());
            applyConnectionKey(config.database.connections[name], key, value);
        }
        else if (current_section == "logging") {
            if (key == "debug") config.logging.debug = parseBool(value);
            else if (key == "file") config.logging.file = value;
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"sql-query - build, inspect and run SQL queries against PostgreSQL or SQLite"};
    app.set_version_flag("-V,--version", "sql-query version 1.0.0");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");
    app.add_option("-C,--connection", config.connection,
                   "Connection name from the configuration file");

    // Ad-hoc connection options
    ConnectionConfig cli_connection;
    app.add_option("--driver", cli_connection.driver, "Database driver (pgsql, sqlite)");
    app.add_option("-H,--host", cli_connection.host, "Database server host")
        ->default_val("localhost");
    app.add_option("-P,--port", cli_connection.port, "Database server port (default: 5432)");
    app.add_option("-u,--user", cli_connection.username, "Database username");
    app.add_option("-p,--password", cli_connection.password, "Database password");
    app.add_option("-D,--database", cli_connection.database,
                   "Database name (or SQLite file path)");
    app.add_option("--sslmode", cli_connection.sslmode, "PostgreSQL sslmode")
        ->default_val("disable");
    app.add_flag("--foreign-keys", cli_connection.foreign_keys,
                 "Enable SQLite foreign key constraints");

    // Query options
    app.add_option("-t,--table", config.query.table, "Table to query")->required();
    app.add_option("-s,--select", config.query.columns, "Columns to select (comma-separated)")
        ->delimiter(',');
    app.add_option("-w,--where", config.query.wheres,
                   "Condition \"column op value\" joined with AND (repeatable)");
    app.add_option("--or-where", config.query.or_wheres,
                   "Condition \"column op value\" joined with OR (repeatable)");
    app.add_option("-o,--order-by", config.query.order_by, "Column to order by");
    app.add_flag("--desc", config.query.descending, "Order descending");

    int64_t limit = 0;
    int64_t offset = 0;
    app.add_option("-l,--limit", limit, "Maximum number of rows");
    app.add_option("--offset", offset, "Number of rows to skip");

    app.add_option("-f,--format", config.query.format, "Output format")
        ->check(CLI::IsMember({"json", "csv"}))
        ->default_val("json");
    app.add_flag_function("--compact", [&config](int64_t) { config.query.pretty = false; },
                 "Single-line JSON output");
    app.add_flag("--dry-run", config.query.dry_run,
                 "Print the compiled SQL and bindings without connecting");

    // Logging
    app.add_flag("-d,--debug", config.logging.debug, "Enable debug output");
    app.add_option("--log-file", config.logging.file, "Also write logs to this file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (app.count("--limit")) config.query.limit = limit;
    if (app.count("--offset")) config.query.offset = offset;

    // Load config file if specified; command line flags take precedence
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config.database = std::move(file_config->database);
            if (!config.logging.debug) config.logging.debug = file_config->logging.debug;
            if (config.logging.file.empty()) config.logging.file = file_config->logging.file;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // A driver on the command line defines (or replaces) the selected connection
    if (app.count("--driver")) {
        std::string name = config.connection.empty() ? config.database.default_connection
                                                     : config.connection;
        config.database.connections[name] = cli_connection;
    }

    config.resolvePasswords();

    return config;
}

bool Config::validate() const {
    if (database.connections.empty()) {
        spdlog::error("No database connection configured (use --config or --driver)");
        return false;
    }

    const std::string& selected = connection.empty() ? database.default_connection : connection;
    if (database.connections.find(selected) == database.connections.end()) {
        spdlog::error("Database connection [{}] not configured", selected);
        return false;
    }

    for (const auto& [name, conn] : database.connections) {
        Dialect dialect = dialectForDriver(conn.driver);
        if (dialect == Dialect::Base) {
            spdlog::error("Connection [{}]: unsupported driver '{}'", name, conn.driver);
            return false;
        }

        // Credentials are irrelevant when nothing is executed
        if (query.dry_run) {
            continue;
        }

        if (dialect == Dialect::SQLite && conn.database.empty()) {
            spdlog::error("Connection [{}]: SQLite database path is required", name);
            return false;
        }

        if (dialect == Dialect::PostgreSQL && conn.username.empty()) {
            spdlog::error("Connection [{}]: database username is required", name);
            return false;
        }
    }

    if (query.format != "json" && query.format != "csv") {
        spdlog::error("Unsupported output format: {}", query.format);
        return false;
    }

    return true;
}

void Config::resolvePasswords() {
    const char* shared_pwd = std::getenv("SQLQUERY_PASSWORD");

    for (auto& [name, conn] : database.connections) {
        if (!conn.password.empty()) {
            continue;
        }

        std::string variable = "SQLQUERY_" + toUpper(name) + "_PASSWORD";
        const char* env_pwd = std::getenv(variable.c_str());
        if (env_pwd) {
            conn.password = env_pwd;
        } else if (shared_pwd) {
            conn.password = shared_pwd;
        }
    }
}

}  // namespace sqlquery
