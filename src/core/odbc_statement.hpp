#pragma once

#include "odbc_connection.hpp"
#include <string>
#include <string_view>

namespace sqlgraph::core {

// Repeats an ODBC call while it reports SQL_STILL_EXECUTING, backing off
// between attempts
template<typename Call>
SQLRETURN call_blocking(Call call) {
    SQLRETURN ret = call();
    if (ret == SQL_STILL_EXECUTING) {
        data::AsyncOperation<void>([&]() {
            ret = call();
            return ret == SQL_STILL_EXECUTING ? data::PollStatus::Pending : data::PollStatus::Ready;
        }).wait();
    }
    return ret;
}

// RAII wrapper for an ODBC statement handle. The poll_* functions are for
// statements in asynchronous mode: Pending means SQL_STILL_EXECUTING and
// the call must be repeated with the same arguments.
class OdbcStatement {
public:
    explicit OdbcStatement(OdbcConnection& conn);
    ~OdbcStatement();

    // Non-copyable, non-movable (due to reference member)
    OdbcStatement(const OdbcStatement&) = delete;
    OdbcStatement& operator=(const OdbcStatement&) = delete;
    OdbcStatement(OdbcStatement&&) = delete;
    OdbcStatement& operator=(OdbcStatement&&) = delete;

    // Closes any cursor and unbinds parameters
    void recycle() noexcept;

    // SQL_ATTR_ASYNC_ENABLE; false when the driver refuses it
    bool enable_async() noexcept;
    bool is_async() const noexcept { return async_; }

    void set_query_timeout(int seconds);

    // false when the statement produced no result (SQL_NO_DATA)
    bool execute(std::string_view sql);
    data::PollStatus poll_execute(std::string_view sql, bool& has_result);

    bool fetch();
    data::PollStatus poll_fetch(bool& has_row);

    // Advances to the next result; has_more is false once all results
    // are consumed
    data::PollStatus poll_more_results(bool& has_more);

    SQLSMALLINT column_count();
    SQLLEN row_count();

    void cancel();
    void close_cursor() noexcept;

    SQLHSTMT get_handle() const noexcept { return handle_; }
    OdbcConnection& get_connection() const noexcept { return conn_; }

private:
    SQLHSTMT handle_ = SQL_NULL_HSTMT;
    OdbcConnection& conn_;
    bool async_ = false;
};

} // namespace sqlgraph::core
