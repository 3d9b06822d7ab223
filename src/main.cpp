#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <exception>
#include <functional>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <CLI/CLI.hpp>
#include "sqlgraph/version.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/odbc_connection.hpp"
#include "core/odbc_environment.hpp"
#include "core/odbc_error.hpp"
#include "cli/json_parameters.hpp"
#include "graph/crud_service.hpp"
#include "reporting/console_reporter.hpp"
#include "reporting/json_reporter.hpp"

using namespace sqlgraph;

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void on_interrupt(int) {
    g_interrupted.store(true);
}

// Options of the edge commands: the edge table and its two endpoints
struct EdgeOptions {
    std::string edge;
    std::string from_table;
    std::string from;
    std::string to_table;
    std::string to;
    std::string parameters;
    std::string where;
};

void add_edge_options(CLI::App* command, EdgeOptions& options, bool with_where) {
    command->add_option("edge", options.edge, "Edge table")->required();
    command->add_option("--from-table", options.from_table, "Node table of the from endpoint")->required();
    command->add_option("--from", options.from, "JSON object selecting the from node")->required();
    command->add_option("--to-table", options.to_table, "Node table of the to endpoint")->required();
    command->add_option("--to", options.to, "JSON object selecting the to node")->required();
    command->add_option("-p,--parameters", options.parameters, "JSON object of edge columns");
    if (with_where) {
        command->add_option("-w,--where", options.where, "JSON object restricting the updated edges");
    }
}

graph::GraphEntityReference from_reference(const EdgeOptions& options) {
    return graph::GraphEntityReference(options.from_table, cli::parse_bag(options.from));
}

graph::GraphEntityReference to_reference(const EdgeOptions& options) {
    return graph::GraphEntityReference(options.to_table, cli::parse_bag(options.to));
}

// How often the interrupt flag is checked while an operation runs
constexpr std::chrono::milliseconds kInterruptCheckInterval{100};

// Runs an operation to completion on an io_context. Ctrl+C requests
// cancellation, which wakes the operation and is observed on its next step.
void drive(data::AsyncOperationBase& operation, data::CancellationSource& source) {
    boost::asio::io_context io;
    boost::asio::steady_timer watch(io);
    bool finished = false;
    std::exception_ptr failure;

    std::function<void(const boost::system::error_code&)> check_interrupt =
        [&](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted || finished) {
                return;
            }
            if (g_interrupted.load() && !source.is_cancellation_requested()) {
                LOG_WARN("Interrupted, cancelling the running command");
                source.cancel();
            }
            watch.expires_after(kInterruptCheckInterval);
            watch.async_wait(check_interrupt);
        };

    watch.expires_after(kInterruptCheckInterval);
    watch.async_wait(check_interrupt);
    data::async_run(io.get_executor(), operation, source.token(),
                    [&](std::exception_ptr error) {
                        finished = true;
                        failure = std::move(error);
                        watch.cancel();
                    });
    io.run();

    if (failure) {
        std::rethrow_exception(failure);
    }
}

template<typename T>
T run(data::AsyncOperation<T> operation, data::CancellationSource& source) {
    drive(operation, source);
    return operation.result();
}

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? value : "";
}

} // anonymous namespace

int main(int argc, char** argv) {
    CLI::App app{
        "sqlgraph - SQL Server graph table client\n"
        "\n"
        "  Checks, inserts, updates and deletes nodes and edges of SQL Server\n"
        "  graph tables over ODBC, and runs parameterized queries.\n"
        "\n"
        "Examples:\n"
        "  sqlgraph node-insert Person -p '{\"name\":\"alice\",\"age\":31}'\n"
        "  sqlgraph edge-insert Likes --from-table Person --from '{\"name\":\"alice\"}' \\\n"
        "           --to-table Person --to '{\"name\":\"bob\"}' -p '{\"since\":2020}'\n"
        "  sqlgraph query 'SELECT name FROM Person WHERE age > @age' -p '{\"age\":30}' -o json\n",
        "sqlgraph"
    };

    app.set_version_flag("--version,-V", SQLGRAPH_VERSION);

    std::string connection_string = env_or_empty("SQLGRAPH_CONNECTION");
    app.add_option("-c,--connection", connection_string,
                   "ODBC connection string (default: $SQLGRAPH_CONNECTION)");

    int timeout = 0;
    app.add_option("-t,--timeout", timeout, "Command timeout in seconds (0 = driver default)")
        ->check(CLI::NonNegativeNumber);

    std::string log_level = "warn";
    app.add_option("--log-level", log_level, "trace, debug, info, warn, error or fatal")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"}, CLI::ignore_case));

    std::string log_file;
    app.add_option("--log-file", log_file, "Write the log to FILE instead of the console");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Show the connection and command durations");

    std::string output_format = "console";
    app.add_option("-o,--output", output_format,
                   "Output format: 'console' (default) or 'json'")
        ->check(CLI::IsMember({"console", "json"}));

    std::string json_file;
    app.add_option("-f,--file", json_file,
                   "Write JSON output to FILE instead of stdout");

    app.require_subcommand(1);

    // Node commands
    std::string node;
    std::string node_parameters;
    std::string node_where;
    std::string node_id;
    bool named_insert = false;

    auto* node_exists = app.add_subcommand("node-exists", "Check whether a matching node exists");
    auto* node_insert = app.add_subcommand("node-insert", "Insert a node");
    auto* node_update = app.add_subcommand("node-update", "Update matching nodes");
    auto* node_delete = app.add_subcommand("node-delete", "Delete matching nodes");
    auto* node_resolve = app.add_subcommand("node-id", "Resolve the $node_id of a node");
    for (auto* command : {node_exists, node_insert, node_update, node_delete, node_resolve}) {
        command->add_option("node", node, "Node table")->required();
        command->add_option("-p,--parameters", node_parameters, "JSON object of column values");
    }
    node_insert->add_flag("--named", named_insert,
                          "Name the columns instead of following the table's column order");
    node_update->add_option("-w,--where", node_where, "JSON object restricting the updated nodes");
    node_update->add_option("--id", node_id, "$node_id of the node to update");

    // Edge commands
    EdgeOptions edge_options;
    auto* edge_exists = app.add_subcommand("edge-exists", "Check whether a matching edge exists");
    auto* edge_insert = app.add_subcommand("edge-insert", "Insert an edge between two nodes");
    auto* edge_update = app.add_subcommand("edge-update", "Update edges between two nodes");
    auto* edge_delete = app.add_subcommand("edge-delete", "Delete edges between two nodes");
    add_edge_options(edge_exists, edge_options, false);
    add_edge_options(edge_insert, edge_options, false);
    add_edge_options(edge_update, edge_options, true);
    add_edge_options(edge_delete, edge_options, false);

    std::string entity;
    std::string entity_id;
    bool is_edge = false;
    auto* delete_by_id = app.add_subcommand("delete-by-id", "Delete a node or edge by its identifier");
    delete_by_id->add_option("entity", entity, "Node or edge table")->required();
    delete_by_id->add_option("id", entity_id, "$node_id or $edge_id value")->required();
    delete_by_id->add_flag("--edge", is_edge, "The entity is an edge table");

    // Free query
    std::string query_text;
    std::string query_parameters;
    bool procedure = false;
    bool non_query = false;
    auto* query = app.add_subcommand("query", "Run a parameterized command and print its rows");
    query->add_option("text", query_text, "Command text with @name markers, or a procedure name")
        ->required();
    query->add_option("-p,--parameters", query_parameters, "JSON object of parameters");
    query->add_flag("--procedure", procedure, "Call a stored procedure and report its return value");
    query->add_flag("--non-query", non_query, "Report the affected row count instead of rows");

    CLI11_PARSE(app, argc, argv);

    if (connection_string.empty()) {
        std::cerr << "Error: no connection string (use --connection or SQLGRAPH_CONNECTION)\n";
        return 2;
    }

    core::Logger& logger = core::Logger::instance();
    logger.set_level(core::parse_log_level(log_level).value_or(core::LogLevel::WARN));
    if (!log_file.empty()) {
        if (!logger.set_output(log_file)) {
            std::cerr << "Error: cannot open log file " << log_file << "\n";
            return 3;
        }
        logger.set_console_enabled(false);
    }

    std::unique_ptr<reporting::Reporter> reporter;
    if (output_format == "json") {
        reporter = std::make_unique<reporting::JsonReporter>(json_file);
    } else {
        reporter = std::make_unique<reporting::ConsoleReporter>(std::cout, verbose);
    }

    std::signal(SIGINT, on_interrupt);

    CLI::App* command = app.get_subcommands().front();
    reporting::CommandResult result;
    result.command = command->get_name();

    reporter->report_start(connection_string);

    try {
        auto environment = core::OdbcEnvironment::shared();
        graph::CrudService service(
            [environment, connection_string]() -> std::unique_ptr<data::DbConnection> {
                return std::make_unique<core::OdbcConnection>(environment, connection_string);
            },
            timeout);
        data::CancellationSource source;
        auto started = std::chrono::steady_clock::now();

        if (command == node_exists) {
            result.target = node;
            result.exists = service.any_node(node, cli::parse_bag(node_parameters));
        } else if (command == node_insert) {
            result.target = node;
            auto bag = cli::parse_bag(node_parameters);
            result.affected_rows = named_insert
                ? run(service.insert_node_async(node, bag, source.token()), source)
                : service.insert_node(node, bag);
        } else if (command == node_update) {
            result.target = node;
            auto bag = cli::parse_bag(node_parameters);
            if (!node_id.empty()) {
                result.affected_rows = run(
                    service.update_node_by_node_id_async(node, bag, data::SqlValue(node_id), source.token()),
                    source);
            } else {
                result.affected_rows = run(
                    service.update_node_async(node, bag, cli::parse_bag(node_where), source.token()),
                    source);
            }
        } else if (command == node_delete) {
            result.target = node;
            result.affected_rows = run(
                service.delete_node_async(node, cli::parse_bag(node_parameters), source.token()), source);
        } else if (command == node_resolve) {
            result.target = node;
            result.value = run(
                service.resolve_node_id_async(graph::GraphEntityReference(node, cli::parse_bag(node_parameters)),
                                              source.token()),
                source);
        } else if (command == edge_exists) {
            result.target = edge_options.edge;
            result.exists = service.any_edge(edge_options.edge, from_reference(edge_options),
                                             to_reference(edge_options),
                                             cli::parse_bag(edge_options.parameters));
        } else if (command == edge_insert) {
            result.target = edge_options.edge;
            result.affected_rows = run(
                service.insert_edge_async(edge_options.edge, from_reference(edge_options),
                                          to_reference(edge_options),
                                          cli::parse_bag(edge_options.parameters), source.token()),
                source);
        } else if (command == edge_update) {
            result.target = edge_options.edge;
            result.affected_rows = run(
                service.update_edge_async(edge_options.edge, from_reference(edge_options),
                                          to_reference(edge_options),
                                          cli::parse_bag(edge_options.parameters),
                                          cli::parse_bag(edge_options.where), source.token()),
                source);
        } else if (command == edge_delete) {
            result.target = edge_options.edge;
            result.affected_rows = run(
                service.delete_edge_async(edge_options.edge, from_reference(edge_options),
                                          to_reference(edge_options),
                                          cli::parse_bag(edge_options.parameters), source.token()),
                source);
        } else if (command == delete_by_id) {
            result.target = entity;
            result.affected_rows = run(
                service.delete_by_id_async(entity, data::SqlValue(entity_id), !is_edge, source.token()),
                source);
        } else if (command == query) {
            result.target = query_text;
            core::OdbcConnection connection(environment, connection_string);
            data::ExecutionContext context(connection, nullptr, timeout);
            auto executor = data::build_query(
                context, query_text, cli::parse_bag(query_parameters),
                procedure ? data::CommandType::StoredProcedure : data::CommandType::Text);

            data::OutputParameter<std::optional<int32_t>> return_value;
            if (procedure) {
                executor.return_value(return_value);
            }

            if (non_query) {
                result.affected_rows = run(executor.execute_non_query_async(source.token()), source);
            } else {
                // One row per step, so an interrupt is seen between rows
                auto reading = executor.execute_async(
                    [&result](data::ResultCursor& cursor) {
                        if (result.columns.empty()) {
                            result.columns = cursor.field_names();
                        }
                        bool has_row = false;
                        if (data::PollStatus status = cursor.read_async(has_row);
                            status != data::PollStatus::Ready) {
                            return status;
                        }
                        if (!has_row) {
                            return data::PollStatus::Ready;
                        }
                        std::vector<data::SqlValue> row;
                        row.reserve(cursor.field_count());
                        for (size_t i = 0; i < cursor.field_count(); ++i) {
                            row.push_back(cursor.get_value(i));
                        }
                        result.rows.push_back(std::move(row));
                        return data::PollStatus::Yielded;
                    },
                    source.token());
                drive(reading, source);
            }

            if (procedure) {
                auto value = return_value.value();
                result.value = value ? data::SqlValue(*value) : data::SqlValue{};
            }
        }

        result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - started);
        reporter->report_result(result);
        reporter->report_end();
        return 0;

    } catch (const core::OdbcError& e) {
        reporter->report_error(result.command, e.what());
        reporter->report_end();
        std::cerr << "\nODBC Error: " << e.what() << "\n";
        std::cerr << e.format_diagnostics() << "\n";
        return 2;
    } catch (const core::OperationCancelled& e) {
        reporter->report_error(result.command, e.what());
        reporter->report_end();
        return 130;
    } catch (const std::exception& e) {
        reporter->report_error(result.command, e.what());
        reporter->report_end();
        std::cerr << "\nError: " << e.what() << "\n";
        return 3;
    }
}
