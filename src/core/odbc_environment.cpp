#include "odbc_environment.hpp"
#include "odbc_error.hpp"
#include "logger.hpp"
#include <mutex>

namespace sqlgraph::core {

OdbcEnvironment::OdbcEnvironment() {
    SQLRETURN ret = SQLAllocHandle(SQL_HANDLE_ENV, SQL_NULL_HANDLE, &handle_);
    check_odbc_result(ret, SQL_HANDLE_ENV, SQL_NULL_HANDLE, "SQLAllocHandle(ENV)");

    // ODBC 3.80 is needed for asynchronous connection functions; older
    // driver managers get 3.x
    ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3_80, 0);
    if (!SQL_SUCCEEDED(ret)) {
        LOG_DEBUG("Driver manager refused ODBC 3.80, requesting ODBC 3");
        ret = SQLSetEnvAttr(handle_, SQL_ATTR_ODBC_VERSION, (SQLPOINTER)SQL_OV_ODBC3, 0);
    }
    if (!SQL_SUCCEEDED(ret)) {
        OdbcError error = OdbcError::from_handle(SQL_HANDLE_ENV, handle_, "SQLSetEnvAttr(ODBC_VERSION)");
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        handle_ = SQL_NULL_HENV;
        throw error;
    }
}

OdbcEnvironment::~OdbcEnvironment() {
    if (handle_ != SQL_NULL_HENV) {
        SQLFreeHandle(SQL_HANDLE_ENV, handle_);
    }
}

OdbcEnvironment::OdbcEnvironment(OdbcEnvironment&& other) noexcept
    : handle_(other.handle_) {
    other.handle_ = SQL_NULL_HENV;
}

OdbcEnvironment& OdbcEnvironment::operator=(OdbcEnvironment&& other) noexcept {
    if (this != &other) {
        if (handle_ != SQL_NULL_HENV) {
            SQLFreeHandle(SQL_HANDLE_ENV, handle_);
        }
        handle_ = other.handle_;
        other.handle_ = SQL_NULL_HENV;
    }
    return *this;
}

std::shared_ptr<OdbcEnvironment> OdbcEnvironment::shared() {
    static std::mutex mutex;
    static std::weak_ptr<OdbcEnvironment> current;

    std::lock_guard<std::mutex> lock(mutex);
    auto env = current.lock();
    if (!env) {
        env = std::make_shared<OdbcEnvironment>();
        current = env;
    }
    return env;
}

} // namespace sqlgraph::core
