#pragma once

#include "reporter.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace sqlgraph::reporting {

// SqlValue -> JSON. Dates, decimals and chars render as strings.
nlohmann::json value_to_json(const data::SqlValue& value);

// JSON reporter for structured output. The document is written by
// report_end(), to `output_file` or to `out` when no file is given.
class JsonReporter : public Reporter {
public:
    explicit JsonReporter(const std::string& output_file = "", std::ostream& out = std::cout)
        : output_file_(output_file), out_(out) {}

    void report_start(const std::string& connection_string) override;
    void report_result(const CommandResult& result) override;
    void report_error(const std::string& command, const std::string& message) override;
    void report_end() override;

    const nlohmann::json& document() const noexcept { return root_; }

private:
    std::string output_file_;
    std::ostream& out_;
    nlohmann::json root_;
    nlohmann::json results_;
};

} // namespace sqlgraph::reporting
