#include "console_reporter.hpp"
#include "sqlgraph/version.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace sqlgraph::reporting {

namespace {

constexpr size_t kMaxColumnWidth = 40;

std::string cell_text(const data::SqlValue& value) {
    if (data::is_null(value)) {
        return "NULL";
    }
    std::string text = data::to_string(value);
    if (text.size() > kMaxColumnWidth) {
        text = text.substr(0, kMaxColumnWidth - 3) + "...";
    }
    return text;
}

} // anonymous namespace

void ConsoleReporter::report_start(const std::string& connection_string) {
    out_ << "sqlgraph v" << SQLGRAPH_VERSION << "\n";
    if (verbose_) {
        out_ << "  Connection:   " << mask_connection_string(connection_string) << "\n";
    }
    out_ << "\n";
}

void ConsoleReporter::report_result(const CommandResult& result) {
    out_ << result.command << " " << result.target << "\n";

    if (result.exists) {
        out_ << "  Exists:        " << (*result.exists ? "yes" : "no") << "\n";
    }
    if (result.affected_rows) {
        out_ << "  Rows affected: " << *result.affected_rows << "\n";
    }
    if (result.value) {
        out_ << "  Value:         " << cell_text(*result.value) << "\n";
    }
    if (!result.columns.empty()) {
        report_rows(result);
    }
    if (verbose_) {
        out_ << "  Duration:      " << format_duration(result.duration) << "\n";
    }
    out_ << "\n";
}

void ConsoleReporter::report_rows(const CommandResult& result) {
    std::vector<size_t> widths;
    widths.reserve(result.columns.size());
    for (const auto& column : result.columns) {
        widths.push_back(std::min(std::max<size_t>(column.size(), 4), kMaxColumnWidth));
    }
    for (const auto& row : result.rows) {
        for (size_t i = 0; i < row.size() && i < widths.size(); ++i) {
            widths[i] = std::max(widths[i], cell_text(row[i]).size());
        }
    }

    auto separator = [&]() {
        out_ << "+";
        for (size_t width : widths) {
            out_ << std::string(width + 2, '-') << "+";
        }
        out_ << "\n";
    };

    separator();
    out_ << "|";
    for (size_t i = 0; i < result.columns.size(); ++i) {
        out_ << " " << std::left << std::setw(static_cast<int>(widths[i]))
             << result.columns[i].substr(0, widths[i]) << " |";
    }
    out_ << "\n";
    separator();

    for (const auto& row : result.rows) {
        out_ << "|";
        for (size_t i = 0; i < widths.size(); ++i) {
            std::string text = i < row.size() ? cell_text(row[i]) : "";
            out_ << " " << std::left << std::setw(static_cast<int>(widths[i])) << text << " |";
        }
        out_ << "\n";
    }

    separator();
    out_ << std::right << "(" << result.rows.size() << (result.rows.size() == 1 ? " row" : " rows") << ")\n";
}

void ConsoleReporter::report_error(const std::string& command, const std::string& message) {
    out_ << command << "\n";
    out_ << "  [ERR!] " << message << "\n\n";
}

void ConsoleReporter::report_end() {
    out_ << std::flush;
}

std::string ConsoleReporter::format_duration(std::chrono::microseconds duration) const {
    auto us = duration.count();

    if (us < 1000) {
        return std::to_string(us) + " us";
    }
    std::ostringstream oss;
    if (us < 1000000) {
        oss << std::fixed << std::setprecision(2) << (us / 1000.0) << " ms";
    } else {
        oss << std::fixed << std::setprecision(2) << (us / 1000000.0) << " s";
    }
    return oss.str();
}

} // namespace sqlgraph::reporting
