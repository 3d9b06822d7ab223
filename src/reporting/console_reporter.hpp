#pragma once

#include "reporter.hpp"
#include <iostream>

namespace sqlgraph::reporting {

// Console reporter with formatted output
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}

    void report_start(const std::string& connection_string) override;
    void report_result(const CommandResult& result) override;
    void report_error(const std::string& command, const std::string& message) override;
    void report_end() override;

private:
    std::ostream& out_;
    bool verbose_;

    void report_rows(const CommandResult& result);
    std::string format_duration(std::chrono::microseconds duration) const;
};

} // namespace sqlgraph::reporting
