#include "odbc_statement.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"

namespace sqlgraph::core {

OdbcStatement::OdbcStatement(OdbcConnection& conn)
    : conn_(conn) {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_STMT, conn_.get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLAllocHandle(STMT)");
}

OdbcStatement::~OdbcStatement() {
    if (handle_ != SQL_NULL_HSTMT) {
        SQLFreeHandle(SQL_HANDLE_STMT, handle_);
    }
}

void OdbcStatement::recycle() noexcept {
    // SQL_CLOSE silently succeeds even when no cursor is open, unlike
    // SQLCloseCursor which returns 24000 in that case
    SQLFreeStmt(handle_, SQL_CLOSE);
    SQLFreeStmt(handle_, SQL_RESET_PARAMS);
}

bool OdbcStatement::enable_async() noexcept {
    SQLRETURN ret = SQLSetStmtAttr(handle_, SQL_ATTR_ASYNC_ENABLE,
                                   (SQLPOINTER)SQL_ASYNC_ENABLE_ON, SQL_IS_UINTEGER);
    async_ = SQL_SUCCEEDED(ret);
    LOG_IF(async_, "Statement in asynchronous mode",
           "Driver refused SQL_ATTR_ASYNC_ENABLE, statement stays blocking");
    return async_;
}

void OdbcStatement::set_query_timeout(int seconds) {
    SQLRETURN ret = SQLSetStmtAttr(handle_, SQL_ATTR_QUERY_TIMEOUT,
                                   (SQLPOINTER)static_cast<SQLULEN>(seconds), SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLSetStmtAttr(QUERY_TIMEOUT)");
}

bool OdbcStatement::execute(std::string_view sql) {
    SQLRETURN ret = call_blocking([&]() {
        return SQLExecDirect(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));
    });
    if (ret == SQL_NO_DATA) {
        return false;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
    return true;
}

data::PollStatus OdbcStatement::poll_execute(std::string_view sql, bool& has_result) {
    SQLRETURN ret = SQLExecDirect(handle_, (SQLCHAR*)sql.data(), static_cast<SQLINTEGER>(sql.length()));
    if (ret == SQL_STILL_EXECUTING) {
        return data::PollStatus::Pending;
    }
    has_result = ret != SQL_NO_DATA;
    if (has_result) {
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLExecDirect");
    }
    return data::PollStatus::Ready;
}

bool OdbcStatement::fetch() {
    SQLRETURN ret = call_blocking([&]() { return SQLFetch(handle_); });

    if (ret == SQL_NO_DATA) {
        return false;
    }
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    return true;
}

data::PollStatus OdbcStatement::poll_fetch(bool& has_row) {
    SQLRETURN ret = SQLFetch(handle_);
    if (ret == SQL_STILL_EXECUTING) {
        return data::PollStatus::Pending;
    }
    has_row = ret != SQL_NO_DATA;
    if (has_row) {
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLFetch");
    }
    return data::PollStatus::Ready;
}

data::PollStatus OdbcStatement::poll_more_results(bool& has_more) {
    SQLRETURN ret = SQLMoreResults(handle_);
    if (ret == SQL_STILL_EXECUTING) {
        return data::PollStatus::Pending;
    }
    has_more = ret != SQL_NO_DATA;
    if (has_more) {
        check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLMoreResults");
    }
    return data::PollStatus::Ready;
}

SQLSMALLINT OdbcStatement::column_count() {
    SQLSMALLINT count = 0;
    SQLRETURN ret = call_blocking([&]() { return SQLNumResultCols(handle_, &count); });
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLNumResultCols");
    return count;
}

SQLLEN OdbcStatement::row_count() {
    SQLLEN count = -1;
    SQLRETURN ret = SQLRowCount(handle_, &count);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLRowCount");
    return count;
}

void OdbcStatement::cancel() {
    SQLRETURN ret = SQLCancel(handle_);
    check_odbc_result(ret, SQL_HANDLE_STMT, handle_, "SQLCancel");
}

void OdbcStatement::close_cursor() noexcept {
    SQLFreeStmt(handle_, SQL_CLOSE);
}

} // namespace sqlgraph::core
