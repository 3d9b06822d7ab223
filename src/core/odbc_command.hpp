#pragma once

#include "odbc_statement.hpp"
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgraph::core {

// Command text with its @name markers replaced by ODBC '?' markers
struct MarkerRewrite {
    std::string sql;
    std::vector<std::string> markers;   // parameter name per '?', in text order
};

// Replaces every @name whose name is in `known_names` (case-insensitive)
// with '?'. Other @names (T-SQL variables, @@functions) and text inside
// string literals, quoted identifiers and comments are left untouched.
MarkerRewrite rewrite_named_markers(std::string_view text, const std::vector<std::string>& known_names);

// "{? = call name(?,?)}" or "{call name(?,?)}"
std::string build_call_escape(const std::string& procedure, size_t argument_count, bool has_return_value);

// Result set of an OdbcCommand. Each fetched row is read completely, so
// columns can be accessed in any order. Without rows (a command that
// produced no result set) it has no columns and read() returns false.
class OdbcResultCursor : public data::ResultCursor {
public:
    OdbcResultCursor(OdbcStatement& stmt, bool has_rows);

    size_t field_count() const override { return columns_.size(); }
    const std::string& field_name(size_t ordinal) const override;

    bool read() override;
    data::PollStatus read_async(bool& has_row) override;

    bool is_null(size_t ordinal) const override;
    data::SqlValue get_value(size_t ordinal) const override;

private:
    struct Column {
        std::string name;
        SQLSMALLINT sql_type;
    };

    void load_row();
    data::SqlValue read_column(SQLUSMALLINT number, SQLSMALLINT sql_type);
    data::SqlValue read_text(SQLUSMALLINT number);

    OdbcStatement& stmt_;
    std::vector<Column> columns_;
    std::vector<data::SqlValue> row_;
};

// DbCommand on an ODBC statement. Text commands bind named parameters by
// marker position; stored procedures bind positionally, return value first.
class OdbcCommand : public data::DbCommand {
public:
    OdbcCommand(OdbcConnection& conn, data::CommandDefinition definition);
    ~OdbcCommand() override;

    OdbcCommand(const OdbcCommand&) = delete;
    OdbcCommand& operator=(const OdbcCommand&) = delete;

    data::ResultCursor& execute_reader(const std::vector<data::QueryParameterPtr>& params) override;
    data::PollStatus execute_reader_async(const std::vector<data::QueryParameterPtr>& params,
                                          data::ResultCursor*& cursor) override;

    int64_t execute_non_query(const std::vector<data::QueryParameterPtr>& params) override;
    data::PollStatus execute_non_query_async(const std::vector<data::QueryParameterPtr>& params,
                                             int64_t& affected_rows) override;

    void cancel() override;
    void close_cursor() override;

    // SQL text sent to the driver; empty before execution
    const std::string& sql() const noexcept { return sql_; }

private:
    struct ParamBuffer {
        data::QueryParameterPtr param;
        std::vector<char> data;
        SQLLEN indicator = 0;
        SQLSMALLINT c_type = SQL_C_CHAR;
        SQLSMALLINT sql_type = SQL_VARCHAR;
        SQLULEN column_size = 0;
        SQLSMALLINT decimal_digits = 0;
    };

    enum class Phase {
        Idle,
        Executing,
        Skipping,
        Open,
        Draining,
        Done
    };

    void prepare(const std::vector<data::QueryParameterPtr>& params);
    void bind(const data::QueryParameterPtr& param, SQLUSMALLINT number);
    void publish_outputs();

    // Moves past result sets without columns (row counts of procedures)
    data::PollStatus skip_to_rows(bool& has_rows);
    data::PollStatus drain();

    OdbcStatement stmt_;
    data::CommandDefinition definition_;
    std::string sql_;
    std::vector<std::unique_ptr<ParamBuffer>> buffers_;
    std::unique_ptr<OdbcResultCursor> cursor_;
    Phase phase_ = Phase::Idle;
    int64_t affected_rows_ = 0;
    bool awaiting_more_ = false;
    bool cancelled_ = false;
};

} // namespace sqlgraph::core
