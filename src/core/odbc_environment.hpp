#pragma once

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>
#include <memory>

namespace sqlgraph::core {

// RAII wrapper for an ODBC 3.x environment handle
class OdbcEnvironment {
public:
    OdbcEnvironment();
    ~OdbcEnvironment();

    OdbcEnvironment(const OdbcEnvironment&) = delete;
    OdbcEnvironment& operator=(const OdbcEnvironment&) = delete;

    OdbcEnvironment(OdbcEnvironment&& other) noexcept;
    OdbcEnvironment& operator=(OdbcEnvironment&& other) noexcept;

    // Process-wide environment, allocated on first use and kept alive by
    // the connections sharing it
    static std::shared_ptr<OdbcEnvironment> shared();

    SQLHENV get_handle() const noexcept { return handle_; }

private:
    SQLHENV handle_ = SQL_NULL_HENV;
};

} // namespace sqlgraph::core
