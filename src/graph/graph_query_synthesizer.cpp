#include "graph_query_synthesizer.hpp"
#include <array>
#include <cctype>

namespace sqlgraph::graph {

namespace {

constexpr std::array<const char*, 4> kSystemColumns = {"node_id", "edge_id", "from_id", "to_id"};

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (const auto& part : parts) {
        if (part.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += separator;
        }
        result += part;
    }
    return result;
}

} // anonymous namespace

bool GraphQuerySynthesizer::is_system_column(std::string_view name) noexcept {
    for (const char* column : kSystemColumns) {
        if (iequals(name, column)) {
            return true;
        }
    }
    return false;
}

std::string GraphQuerySynthesizer::format_column(const std::string& name) {
    return is_system_column(name) ? "$" + name : name;
}

std::string GraphQuerySynthesizer::build_where_clause(const OptionalBag& parameters,
                                                      bool prepend_where,
                                                      const std::string& param_prefix) {
    if (!parameters || parameters->empty()) {
        return {};
    }

    std::vector<std::string> predicates;
    for (const auto& entry : *parameters) {
        if (data::is_null(entry.value)) {
            predicates.push_back(format_column(entry.name) + " IS NULL");
        } else {
            predicates.push_back(format_column(entry.name) + " = @" + param_prefix + entry.name);
        }
    }
    return (prepend_where ? " WHERE " : "") + join(predicates, " AND ");
}

std::vector<std::string> GraphQuerySynthesizer::build_assignments(const ParameterBag& parameters) {
    std::vector<std::string> assignments;
    for (const auto& entry : parameters) {
        // A null value is not assigned
        if (!data::is_null(entry.value)) {
            assignments.push_back(format_column(entry.name) + " = @" + entry.name);
        }
    }
    return assignments;
}

std::string GraphQuerySynthesizer::build_edge_where_clause(const SqlValue& from_id,
                                                           const SqlValue& to_id,
                                                           const OptionalBag& parameters,
                                                           const std::string& param_prefix) {
    std::vector<std::string> predicates;
    if (!data::is_null(from_id)) {
        predicates.push_back(std::string("$from_id = @") + kFromIdParam);
    }
    if (!data::is_null(to_id)) {
        predicates.push_back(std::string("$to_id = @") + kToIdParam);
    }
    predicates.push_back(build_where_clause(parameters, false, param_prefix));

    std::string joined = join(predicates, " AND ");
    return joined.empty() ? joined : " WHERE " + joined;
}

std::string GraphQuerySynthesizer::column_list(const ParameterBag& parameters) {
    std::string result;
    for (const auto& entry : parameters) {
        if (!result.empty()) {
            result += ",";
        }
        result += entry.name;
    }
    return result;
}

std::string GraphQuerySynthesizer::value_list(const ParameterBag& parameters) {
    std::string result;
    for (const auto& entry : parameters) {
        if (!result.empty()) {
            result += ",";
        }
        result += "@" + entry.name;
    }
    return result;
}

std::string GraphQuerySynthesizer::build_insert(const std::string& table,
                                                const ParameterBag& parameters,
                                                bool positional) {
    std::string query = "INSERT INTO " + table;
    if (!positional) {
        query += "(" + column_list(parameters) + ")";
    }
    return query + " VALUES(" + value_list(parameters) + ")";
}

std::string GraphQuerySynthesizer::build_edge_insert(const std::string& edge,
                                                     const OptionalBag& parameters) {
    std::string values = std::string("@") + kFromIdParam + ", @" + kToIdParam;
    if (parameters && !parameters->empty()) {
        values += ", " + value_list(*parameters);
    }
    return "INSERT INTO " + edge + " VALUES(" + values + ")";
}

std::string GraphQuerySynthesizer::build_exists(const std::string& table,
                                                const std::string& where_clause) {
    return "SELECT COUNT(*) FROM (SELECT TOP 1 * FROM " + table + where_clause + ") d";
}

std::string GraphQuerySynthesizer::build_update(const std::string& table,
                                                const std::vector<std::string>& assignments,
                                                const std::string& where_clause) {
    return "UPDATE " + table + " SET " + join(assignments, " , ") + where_clause + ";";
}

std::string GraphQuerySynthesizer::build_delete(const std::string& table,
                                                const std::string& where_clause) {
    return "DELETE FROM " + table + where_clause;
}

std::string GraphQuerySynthesizer::build_delete_by_id(const std::string& table, bool is_node) {
    return "DELETE FROM " + table + " WHERE " + (is_node ? "$node_id" : "$edge_id") + " = @" + kIdParam;
}

std::string GraphQuerySynthesizer::build_node_id_query(const std::string& table,
                                                       const ParameterBag& parameters) {
    return "SELECT $node_id FROM " + table + build_where_clause(parameters);
}

std::optional<SqlValue> GraphQuerySynthesizer::find_identifier(const OptionalBag& parameters) {
    if (!parameters) {
        return std::nullopt;
    }
    // Priority follows the order of kSystemColumns
    for (const char* column : kSystemColumns) {
        if (const auto* entry = parameters->find(column)) {
            return entry->value;
        }
    }
    return std::nullopt;
}

} // namespace sqlgraph::graph
