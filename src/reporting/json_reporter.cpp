#include "json_reporter.hpp"
#include "sqlgraph/version.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>

namespace sqlgraph::reporting {

nlohmann::json value_to_json(const data::SqlValue& value) {
    switch (value.index()) {
        case 0: return nullptr;
        case 1: return std::get<int64_t>(value);
        case 2: return std::get<int32_t>(value);
        case 3: return std::get<uint8_t>(value);
        case 5: return std::get<float>(value);
        case 6: return std::get<double>(value);
        case 7: return std::get<bool>(value);
        default: return data::to_string(value);
    }
}

void JsonReporter::report_start(const std::string& connection_string) {
    root_ = nlohmann::json::object();
    root_["version"] = SQLGRAPH_VERSION;
    root_["connection_string"] = mask_connection_string(connection_string);
    root_["timestamp"] = std::time(nullptr);
    results_ = nlohmann::json::array();
}

void JsonReporter::report_result(const CommandResult& result) {
    nlohmann::json entry;
    entry["command"] = result.command;
    entry["target"] = result.target;
    entry["status"] = "OK";

    if (result.exists) {
        entry["exists"] = *result.exists;
    }
    if (result.affected_rows) {
        entry["affected_rows"] = *result.affected_rows;
    }
    if (result.value) {
        entry["value"] = value_to_json(*result.value);
    }
    if (!result.columns.empty()) {
        nlohmann::json rows = nlohmann::json::array();
        for (const auto& row : result.rows) {
            nlohmann::json object = nlohmann::json::object();
            for (size_t i = 0; i < row.size() && i < result.columns.size(); ++i) {
                object[result.columns[i]] = value_to_json(row[i]);
            }
            rows.push_back(object);
        }
        entry["columns"] = result.columns;
        entry["rows"] = rows;
    }
    entry["duration_us"] = result.duration.count();

    results_.push_back(entry);
}

void JsonReporter::report_error(const std::string& command, const std::string& message) {
    nlohmann::json entry;
    entry["command"] = command;
    entry["status"] = "ERROR";
    entry["message"] = message;
    results_.push_back(entry);
}

void JsonReporter::report_end() {
    root_["results"] = results_;

    if (output_file_.empty()) {
        out_ << std::setw(2) << root_ << std::endl;
        return;
    }

    std::ofstream file(output_file_);
    if (file.is_open()) {
        file << std::setw(2) << root_ << std::endl;
        std::cout << "JSON report written to: " << output_file_ << std::endl;
    } else {
        std::cerr << "Error: Could not write to " << output_file_ << std::endl;
    }
}

} // namespace sqlgraph::reporting
