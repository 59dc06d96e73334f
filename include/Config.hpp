#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sqlquery {

struct ConnectionConfig {
    std::string driver = "sqlite";  // pgsql, postgres, postgresql, sqlite, sqlite3
    std::string host = "localhost";
    uint16_t port = 0;              // 0 selects the driver default (5432 for PostgreSQL)
    std::string database;           // database name, or file path for SQLite
    std::string username;
    std::string password;

    // SSL options (PostgreSQL)
    std::string sslmode = "disable";
    std::string ssl_ca;
    std::string ssl_cert;
    std::string ssl_key;

    std::chrono::milliseconds connect_timeout{5000};

    // SQLite: PRAGMA foreign_keys = ON after opening
    bool foreign_keys = false;
};

struct DatabaseConfig {
    std::string default_connection = "default";
    std::map<std::string, ConnectionConfig> connections;
};

struct LoggingConfig {
    bool debug = false;
    std::string file;
};

// Query assembled from command-line flags by the sql-query tool
struct QueryOptions {
    std::string table;
    std::vector<std::string> columns;
    std::vector<std::string> wheres;     // "column op value"
    std::vector<std::string> or_wheres;  // "column op value"
    std::string order_by;
    bool descending = false;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    std::string format = "json";         // json, csv
    bool pretty = true;
    bool dry_run = false;
};

struct Config {
    DatabaseConfig database;
    LoggingConfig logging;
    QueryOptions query;

    // Connection chosen on the command line; empty selects the default
    std::string connection;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Fill empty passwords from SQLQUERY_<NAME>_PASSWORD or SQLQUERY_PASSWORD
    void resolvePasswords();
};

}  // namespace sqlquery
