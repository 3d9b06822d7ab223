#pragma once

#include "data/value.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sqlgraph::reporting {

// Outcome of one sqlgraph command. Only the members the command produces
// are set.
struct CommandResult {
    std::string command;
    std::string target;                       // table, edge or query text
    std::optional<bool> exists;
    std::optional<int64_t> affected_rows;
    std::optional<data::SqlValue> value;      // resolved identifier or return value
    std::vector<std::string> columns;
    std::vector<std::vector<data::SqlValue>> rows;
    std::chrono::microseconds duration{0};
};

// Reporter interface
class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void report_start(const std::string& connection_string) = 0;
    virtual void report_result(const CommandResult& result) = 0;
    virtual void report_error(const std::string& command, const std::string& message) = 0;
    virtual void report_end() = 0;
};

// Connection string with the values of PWD and Password replaced by ***
std::string mask_connection_string(const std::string& connection_string);

} // namespace sqlgraph::reporting
