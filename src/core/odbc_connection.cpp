#include "odbc_connection.hpp"
#include "odbc_command.hpp"
#include "odbc_error.hpp"
#include "errors.hpp"
#include "logger.hpp"

namespace sqlgraph::core {

OdbcConnection::OdbcConnection(std::shared_ptr<OdbcEnvironment> env, std::string connection_string)
    : env_(std::move(env)), connection_string_(std::move(connection_string)) {
    if (!env_) {
        throw ContractViolation("ODBC environment must not be null");
    }
    require_name(connection_string_, "Connection string");

    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_DBC, env_->get_handle(), &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, env_->get_handle(), "SQLAllocHandle(DBC)");
}

OdbcConnection::~OdbcConnection() {
    if (connecting_) {
        try {
            cancel_open();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Connect cancellation failed in destructor: ") + e.what());
        }
    }
    if (connected_) {
        try {
            close();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Disconnect failed in destructor: ") + e.what());
        }
    }

    if (handle_ != SQL_NULL_HDBC) {
        SQLFreeHandle(SQL_HANDLE_DBC, handle_);
    }
}

SQLRETURN OdbcConnection::driver_connect() {
    SQLCHAR out_conn_str[1024];
    SQLSMALLINT out_conn_str_len;

    return SQLDriverConnect(
        handle_,
        nullptr,  // No window handle
        (SQLCHAR*)connection_string_.data(),
        static_cast<SQLSMALLINT>(connection_string_.length()),
        out_conn_str,
        sizeof(out_conn_str),
        &out_conn_str_len,
        SQL_DRIVER_NOPROMPT
    );
}

void OdbcConnection::open() {
    if (connected_) {
        throw OdbcError("Already connected");
    }

    SQLRETURN ret = driver_connect();
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;
    LOG_DEBUG("Connected");
}

data::PollStatus OdbcConnection::open_async() {
    if (connected_ && !connecting_) {
        throw OdbcError("Already connected");
    }

    if (!connecting_) {
        SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_ASYNC_DBC_FUNCTIONS_ENABLE,
                                          (SQLPOINTER)SQL_ASYNC_DBC_ENABLE_ON, SQL_IS_UINTEGER);
        if (!SQL_SUCCEEDED(ret)) {
            LOG_DEBUG("Driver has no asynchronous connect, connecting blocking");
            open();
            return data::PollStatus::Ready;
        }
        connecting_ = true;
    }

    // Polled by calling the function again with the same arguments
    SQLRETURN ret = driver_connect();
    if (ret == SQL_STILL_EXECUTING) {
        return data::PollStatus::Pending;
    }

    connecting_ = false;
    SQLSetConnectAttr(handle_, SQL_ATTR_ASYNC_DBC_FUNCTIONS_ENABLE,
                      (SQLPOINTER)SQL_ASYNC_DBC_ENABLE_OFF, SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDriverConnect");
    connected_ = true;
    LOG_DEBUG("Connected asynchronously");
    return data::PollStatus::Ready;
}

void OdbcConnection::cancel_open() {
    if (!connecting_) {
        return;
    }
    connecting_ = false;

    SQLRETURN ret = SQLCancelHandle(SQL_HANDLE_DBC, handle_);
    SQLSetConnectAttr(handle_, SQL_ATTR_ASYNC_DBC_FUNCTIONS_ENABLE,
                      (SQLPOINTER)SQL_ASYNC_DBC_ENABLE_OFF, SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLCancelHandle(DBC)");
    LOG_DEBUG("Asynchronous connect cancelled");
}

void OdbcConnection::close() {
    if (!connected_) {
        return;
    }

    if (in_transaction_) {
        LOG_WARN("Closing connection with an active transaction, rolling back");
        SQLEndTran(SQL_HANDLE_DBC, handle_, SQL_ROLLBACK);
        in_transaction_ = false;
    }

    SQLRETURN ret = SQLDisconnect(handle_);
    connected_ = false;
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLDisconnect");
    LOG_DEBUG("Disconnected");
}

std::unique_ptr<data::DbCommand> OdbcConnection::create_command(const data::CommandDefinition& definition) {
    if (!connected_) {
        throw InvalidStateError("Connection is not open");
    }
    if (definition.transaction) {
        auto* transaction = dynamic_cast<const OdbcTransaction*>(definition.transaction);
        if (!transaction || &transaction->get_connection() != this) {
            throw ContractViolation("Transaction belongs to another connection");
        }
    }
    return std::make_unique<OdbcCommand>(*this, definition);
}

std::unique_ptr<data::DbTransaction> OdbcConnection::begin_transaction() {
    if (!connected_) {
        throw InvalidStateError("Connection is not open");
    }
    if (in_transaction_) {
        throw InvalidStateError("A transaction is already active on this connection");
    }
    return std::make_unique<OdbcTransaction>(*this);
}

void OdbcConnection::set_autocommit(bool enabled) {
    SQLRETURN ret = SQLSetConnectAttr(handle_, SQL_ATTR_AUTOCOMMIT,
                                      (SQLPOINTER)(enabled ? SQL_AUTOCOMMIT_ON : SQL_AUTOCOMMIT_OFF),
                                      SQL_IS_UINTEGER);
    check_odbc_result(ret, SQL_HANDLE_DBC, handle_, "SQLSetConnectAttr(AUTOCOMMIT)");
}

OdbcTransaction::OdbcTransaction(OdbcConnection& conn)
    : conn_(conn) {
    conn_.set_autocommit(false);
    conn_.in_transaction_ = true;
    LOG_DEBUG("Transaction started");
}

OdbcTransaction::~OdbcTransaction() {
    if (!active_) {
        return;
    }
    try {
        rollback();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Rollback of abandoned transaction failed: ") + e.what());
    }
}

void OdbcTransaction::commit() {
    end(SQL_COMMIT);
    LOG_DEBUG("Transaction committed");
}

void OdbcTransaction::rollback() {
    end(SQL_ROLLBACK);
    LOG_DEBUG("Transaction rolled back");
}

void OdbcTransaction::end(SQLSMALLINT completion) {
    if (!active_) {
        throw InvalidStateError("Transaction is no longer active");
    }
    active_ = false;
    if (!conn_.in_transaction_) {
        // Already rolled back by close()
        return;
    }
    conn_.in_transaction_ = false;

    SQLRETURN ret = SQLEndTran(SQL_HANDLE_DBC, conn_.get_handle(), completion);
    check_odbc_result(ret, SQL_HANDLE_DBC, conn_.get_handle(), "SQLEndTran");
    conn_.set_autocommit(true);
}

} // namespace sqlgraph::core
