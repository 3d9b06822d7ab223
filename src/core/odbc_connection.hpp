#pragma once

#include "odbc_environment.hpp"
#include "data/db_connection.hpp"
#include <memory>
#include <string>

namespace sqlgraph::core {

// RAII wrapper for an ODBC connection handle, usable as the backend of a
// QueryExecutor. The connection string is kept so the connection can be
// opened and closed repeatedly.
class OdbcConnection : public data::DbConnection {
public:
    OdbcConnection(std::shared_ptr<OdbcEnvironment> env, std::string connection_string);
    ~OdbcConnection() override;

    // Non-copyable, non-movable (commands and transactions refer back to it)
    OdbcConnection(const OdbcConnection&) = delete;
    OdbcConnection& operator=(const OdbcConnection&) = delete;
    OdbcConnection(OdbcConnection&&) = delete;
    OdbcConnection& operator=(OdbcConnection&&) = delete;

    bool is_open() const noexcept override { return connected_; }
    void open() override;

    // Uses SQL_ATTR_ASYNC_DBC_FUNCTIONS_ENABLE where the driver supports
    // it; otherwise connects blocking and reports Ready
    data::PollStatus open_async() override;
    void cancel_open() override;
    void close() override;

    std::unique_ptr<data::DbCommand> create_command(const data::CommandDefinition& definition) override;
    std::unique_ptr<data::DbTransaction> begin_transaction() override;

    SQLHDBC get_handle() const noexcept { return handle_; }
    OdbcEnvironment& get_environment() const noexcept { return *env_; }

    bool in_transaction() const noexcept { return in_transaction_; }

private:
    friend class OdbcTransaction;

    SQLRETURN driver_connect();
    void set_autocommit(bool enabled);

    SQLHDBC handle_ = SQL_NULL_HDBC;
    std::shared_ptr<OdbcEnvironment> env_;
    std::string connection_string_;
    bool connected_ = false;
    bool connecting_ = false;
    bool in_transaction_ = false;
};

// Manual-commit transaction on an OdbcConnection. Rolled back on destruction
// unless committed or rolled back before.
class OdbcTransaction : public data::DbTransaction {
public:
    explicit OdbcTransaction(OdbcConnection& conn);
    ~OdbcTransaction() override;

    OdbcTransaction(const OdbcTransaction&) = delete;
    OdbcTransaction& operator=(const OdbcTransaction&) = delete;

    void commit() override;
    void rollback() override;
    bool is_active() const noexcept override { return active_; }

    OdbcConnection& get_connection() const noexcept { return conn_; }

private:
    void end(SQLSMALLINT completion);

    OdbcConnection& conn_;
    bool active_ = true;
};

} // namespace sqlgraph::core
