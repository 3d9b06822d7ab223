#pragma once

#include "data/parameter_binder.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgraph::graph {

using data::ParameterBag;
using data::SqlValue;
using OptionalBag = std::optional<ParameterBag>;

// Parameter names under which resolved identifiers are bound
inline constexpr const char* kFromIdParam = "_from_id";
inline constexpr const char* kToIdParam = "_to_id";
inline constexpr const char* kNodeIdParam = "_node_id";
inline constexpr const char* kIdParam = "_id";

// Prefix given to the names of a WHERE bag bound next to a SET bag
inline constexpr const char* kWherePrefix = "w_";

// A node (or edge) table and the bag identifying a row in it. The
// identifier is filled in by resolution and stays null when nothing matched.
struct GraphEntityReference {
    std::string table;
    OptionalBag parameters;
    SqlValue id;
    bool resolved = false;

    GraphEntityReference() = default;
    GraphEntityReference(std::string table_name, OptionalBag bag)
        : table(std::move(table_name)), parameters(std::move(bag)) {}
};

/**
 * @brief Text building for SQL Server graph tables
 *
 * Stateless. System columns (node_id, edge_id, from_id, to_id) are written
 * with the '$' sigil; every value is referenced as an @name marker.
 */
class GraphQuerySynthesizer {
public:
    static bool is_system_column(std::string_view name) noexcept;

    // "$node_id" for system columns, the name unchanged otherwise
    static std::string format_column(const std::string& name);

    // "<column> = @<prefix><name>" or "<column> IS NULL" per entry, joined
    // with " AND ". Empty string for an absent or empty bag.
    static std::string build_where_clause(const OptionalBag& parameters,
                                          bool prepend_where = true,
                                          const std::string& param_prefix = "");

    // "<column> = @<name>" per non-null entry
    static std::vector<std::string> build_assignments(const ParameterBag& parameters);

    // From-id, to-id and bag predicates; absent components are omitted
    static std::string build_edge_where_clause(const SqlValue& from_id, const SqlValue& to_id,
                                               const OptionalBag& parameters,
                                               const std::string& param_prefix = "");

    static std::string column_list(const ParameterBag& parameters);
    static std::string value_list(const ParameterBag& parameters);

    static std::string build_insert(const std::string& table, const ParameterBag& parameters,
                                    bool positional = false);
    static std::string build_edge_insert(const std::string& edge, const OptionalBag& parameters);

    static std::string build_exists(const std::string& table, const std::string& where_clause);

    static std::string build_update(const std::string& table,
                                    const std::vector<std::string>& assignments,
                                    const std::string& where_clause);

    static std::string build_delete(const std::string& table, const std::string& where_clause);
    static std::string build_delete_by_id(const std::string& table, bool is_node);

    // "SELECT $node_id FROM <table> WHERE ..." over the whole bag
    static std::string build_node_id_query(const std::string& table, const ParameterBag& parameters);

    // Value of the first of node_id, edge_id, from_id, to_id present in the
    // bag (matched case-insensitively)
    static std::optional<SqlValue> find_identifier(const OptionalBag& parameters);
};

} // namespace sqlgraph::graph
