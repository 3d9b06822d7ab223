#pragma once

#include <string>
#include <vector>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#endif

#include <sql.h>
#include <sqlext.h>

namespace sqlgraph::core {

// Diagnostic record from SQLGetDiagRec
struct OdbcDiagnostic {
    std::string sqlstate;           // 5-character SQLSTATE code
    SQLINTEGER native_error;        // Driver-specific error code
    std::string message;
    SQLSMALLINT record_number;
};

// Failure reported by the driver manager or the driver. Carries every
// diagnostic record of the failing handle.
class OdbcError : public std::runtime_error {
public:
    static OdbcError from_handle(SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context = "");

    explicit OdbcError(const std::string& message);
    OdbcError(const std::string& message, std::vector<OdbcDiagnostic> diagnostics);

    const std::vector<OdbcDiagnostic>& diagnostics() const noexcept { return diagnostics_; }

    // SQLSTATE of the first record; empty without diagnostics
    std::string sqlstate() const;

    std::string format_diagnostics() const;

private:
    std::vector<OdbcDiagnostic> diagnostics_;
};

std::vector<OdbcDiagnostic> read_diagnostics(SQLSMALLINT handle_type, SQLHANDLE handle);

// Throws OdbcError unless `ret` is SQL_SUCCESS or SQL_SUCCESS_WITH_INFO.
// Warnings of SQL_SUCCESS_WITH_INFO are logged at debug level.
void check_odbc_result(SQLRETURN ret, SQLSMALLINT handle_type, SQLHANDLE handle, const std::string& context);

} // namespace sqlgraph::core
