#include "ConditionParser.hpp"
#include "Config.hpp"
#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "QueryBuilder.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

using namespace sqlquery;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Query output owns stdout, so console logging goes to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("sql-query", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

// Result key a selected column comes back under: "u.name" -> "name",
// "name AS n" -> "n"
std::string resultKey(const std::string& column) {
    std::string lowered = column;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t alias = lowered.rfind(" as ");
    if (alias != std::string::npos) {
        std::string key = column.substr(alias + 4);
        key.erase(0, key.find_first_not_of(' '));
        return key;
    }

    size_t dot = column.rfind('.');
    return dot == std::string::npos ? column : column.substr(dot + 1);
}

void applyOptions(QueryBuilder& builder, const QueryOptions& options) {
    if (!options.columns.empty()) {
        builder.select(options.columns);
    }

    ConditionParser parser;
    for (const auto& where : options.wheres) {
        parser.parse(where).applyTo(builder);
    }
    for (const auto& where : options.or_wheres) {
        parser.parse(where).applyTo(builder, true);
    }

    if (!options.order_by.empty()) {
        builder.orderBy(options.order_by, options.descending ? "desc" : "asc");
    }
    if (options.limit) {
        builder.limit(*options.limit);
    }
    if (options.offset) {
        builder.offset(*options.offset);
    }
}

void printCompiled(const CompiledQuery& compiled, bool pretty) {
    json out = json::object();
    out["sql"] = compiled.sql;
    json bindings = json::array();
    for (const auto& value : compiled.bindings) {
        bindings.push_back(FormatConverter::valueToJSON(value));
    }
    out["bindings"] = std::move(bindings);
    std::cout << (pretty ? out.dump(2) : out.dump()) << std::endl;
}

void printRows(const Rows& rows, const QueryOptions& options) {
    if (options.format == "csv") {
        bool explicitColumns = !options.columns.empty() &&
            std::none_of(options.columns.begin(), options.columns.end(),
                         [](const std::string& c) { return c.find('*') != std::string::npos; });

        if (explicitColumns) {
            std::vector<std::string> keys;
            for (const auto& column : options.columns) {
                keys.push_back(resultKey(column));
            }
            std::cout << FormatConverter::toCSV(keys, rows);
        } else {
            std::cout << FormatConverter::toCSV(rows);
        }
        return;
    }

    JSONOptions json_options;
    json_options.pretty = options.pretty;
    std::cout << FormatConverter::toJSON(rows, json_options) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.logging.debug, config.logging.file);

    // Validate configuration
    if (!config.validate()) {
        return 1;
    }

    const std::string& name = config.connection.empty() ? config.database.default_connection
                                                        : config.connection;
    const ConnectionConfig& connection = config.database.connections.at(name);

    try {
        if (config.query.dry_run) {
            QueryBuilder builder(Grammar::forDriver(connection.driver), config.query.table);
            applyOptions(builder, config.query);
            printCompiled(builder.toSql(), config.query.pretty);
            return 0;
        }

        DatabaseManager db(config.database);
        QueryBuilder builder = db.table(config.query.table, name);
        applyOptions(builder, config.query);

        spdlog::debug("Running query on [{}]: {}", name, builder.toSql().sql);
        Rows rows = builder.get();
        spdlog::info("Query on [{}] returned {} rows", name, rows.size());

        printRows(rows, config.query);

    } catch (const std::invalid_argument& e) {
        spdlog::error("Invalid query: {}", e.what());
        return 1;
    } catch (const DatabaseException& e) {
        spdlog::error("{} error: {}", ErrorHandler::kindName(e.kind()), e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    return 0;
}
