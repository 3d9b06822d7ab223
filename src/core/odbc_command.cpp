#include "odbc_command.hpp"
#include "odbc_error.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>

namespace sqlgraph::core {

using data::DbType;
using data::ParameterDirection;
using data::PollStatus;
using data::SqlValue;

namespace {

bool is_name_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

// Index just past a quoted run starting at `pos` (doubled closing quote
// characters are escapes)
size_t skip_quoted(std::string_view text, size_t pos, char close) {
    size_t i = pos + 1;
    while (i < text.size()) {
        if (text[i] == close) {
            if (i + 1 < text.size() && text[i + 1] == close) {
                i += 2;
                continue;
            }
            return i + 1;
        }
        ++i;
    }
    return text.size();
}

template<typename V>
void store(std::vector<char>& data, const V& value) {
    data.resize(sizeof(V));
    std::memcpy(data.data(), &value, sizeof(V));
}

template<typename V>
V load(const std::vector<char>& data) {
    V value{};
    std::memcpy(&value, data.data(), std::min(sizeof(V), data.size()));
    return value;
}

SQL_TIMESTAMP_STRUCT to_timestamp(const data::DateTime& dt) {
    SQL_TIMESTAMP_STRUCT ts{};
    ts.year = dt.year;
    ts.month = dt.month;
    ts.day = dt.day;
    ts.hour = dt.hour;
    ts.minute = dt.minute;
    ts.second = dt.second;
    ts.fraction = dt.fraction;
    return ts;
}

data::DateTime from_timestamp(const SQL_TIMESTAMP_STRUCT& ts) {
    data::DateTime dt;
    dt.year = ts.year;
    dt.month = ts.month;
    dt.day = ts.day;
    dt.hour = ts.hour;
    dt.minute = ts.minute;
    dt.second = ts.second;
    dt.fraction = ts.fraction;
    return dt;
}

SQLSMALLINT io_type(ParameterDirection direction) noexcept {
    switch (direction) {
        case ParameterDirection::Input:       return SQL_PARAM_INPUT;
        case ParameterDirection::InputOutput: return SQL_PARAM_INPUT_OUTPUT;
        case ParameterDirection::Output:
        case ParameterDirection::ReturnValue: return SQL_PARAM_OUTPUT;
    }
    return SQL_PARAM_INPUT;
}

// Scale of a decimal in text form ("12.340" -> 3)
SQLSMALLINT scale_of(const std::string& digits) {
    auto dot = digits.find('.');
    return dot == std::string::npos ? 0 : static_cast<SQLSMALLINT>(digits.size() - dot - 1);
}

constexpr size_t kDefaultOutputTextSize = 4000;
constexpr size_t kTextChunk = 1024;

} // anonymous namespace

MarkerRewrite rewrite_named_markers(std::string_view text, const std::vector<std::string>& known_names) {
    MarkerRewrite result;
    result.sql.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (c == '\'' || c == '"' || c == '[') {
            size_t end = skip_quoted(text, i, c == '[' ? ']' : c);
            result.sql.append(text.substr(i, end - i));
            i = end;
        } else if (c == '-' && i + 1 < text.size() && text[i + 1] == '-') {
            size_t end = text.find('\n', i);
            end = end == std::string_view::npos ? text.size() : end;
            result.sql.append(text.substr(i, end - i));
            i = end;
        } else if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            size_t end = text.find("*/", i + 2);
            end = end == std::string_view::npos ? text.size() : end + 2;
            result.sql.append(text.substr(i, end - i));
            i = end;
        } else if (c == '@') {
            size_t end = i + 1;
            if (end < text.size() && text[end] == '@') {
                // @@ROWCOUNT and friends
                while (end < text.size() && (text[end] == '@' || is_name_char(text[end]))) {
                    ++end;
                }
                result.sql.append(text.substr(i, end - i));
                i = end;
                continue;
            }
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
            std::string_view name = text.substr(i + 1, end - i - 1);
            auto known = std::find_if(known_names.begin(), known_names.end(),
                                      [&](const std::string& n) { return iequals(n, name); });
            if (!name.empty() && known != known_names.end()) {
                result.sql += '?';
                result.markers.push_back(*known);
            } else {
                result.sql.append(text.substr(i, end - i));
            }
            i = end;
        } else {
            result.sql += c;
            ++i;
        }
    }
    return result;
}

std::string build_call_escape(const std::string& procedure, size_t argument_count, bool has_return_value) {
    std::string sql = has_return_value ? "{? = call " : "{call ";
    sql += procedure;
    if (argument_count > 0) {
        sql += "(";
        for (size_t i = 0; i < argument_count; ++i) {
            sql += i == 0 ? "?" : ",?";
        }
        sql += ")";
    }
    sql += "}";
    return sql;
}

// OdbcResultCursor

OdbcResultCursor::OdbcResultCursor(OdbcStatement& stmt, bool has_rows)
    : stmt_(stmt) {
    if (!has_rows) {
        return;
    }

    SQLSMALLINT count = stmt_.column_count();
    columns_.reserve(count);
    for (SQLUSMALLINT i = 1; i <= static_cast<SQLUSMALLINT>(count); ++i) {
        SQLCHAR name[256] = {0};
        SQLSMALLINT name_length = 0;
        SQLSMALLINT data_type = 0;
        SQLULEN column_size = 0;
        SQLSMALLINT decimal_digits = 0;
        SQLSMALLINT nullable = 0;

        SQLRETURN ret = call_blocking([&]() {
            return SQLDescribeCol(stmt_.get_handle(), i, name, sizeof(name), &name_length,
                                  &data_type, &column_size, &decimal_digits, &nullable);
        });
        check_odbc_result(ret, SQL_HANDLE_STMT, stmt_.get_handle(), "SQLDescribeCol");
        columns_.push_back(Column{reinterpret_cast<char*>(name), data_type});
    }
}

const std::string& OdbcResultCursor::field_name(size_t ordinal) const {
    return columns_.at(ordinal).name;
}

bool OdbcResultCursor::read() {
    if (columns_.empty() || !stmt_.fetch()) {
        row_.clear();
        return false;
    }
    load_row();
    return true;
}

PollStatus OdbcResultCursor::read_async(bool& has_row) {
    if (columns_.empty()) {
        has_row = false;
        return PollStatus::Ready;
    }
    if (stmt_.poll_fetch(has_row) == PollStatus::Pending) {
        return PollStatus::Pending;
    }
    if (has_row) {
        load_row();
    } else {
        row_.clear();
    }
    return PollStatus::Ready;
}

bool OdbcResultCursor::is_null(size_t ordinal) const {
    if (row_.empty()) {
        throw InvalidStateError("Cursor is not positioned on a row");
    }
    return data::is_null(row_.at(ordinal));
}

SqlValue OdbcResultCursor::get_value(size_t ordinal) const {
    if (row_.empty()) {
        throw InvalidStateError("Cursor is not positioned on a row");
    }
    return row_.at(ordinal);
}

void OdbcResultCursor::load_row() {
    row_.clear();
    row_.reserve(columns_.size());
    // SQLGetData requires ascending column order on most drivers
    for (size_t i = 0; i < columns_.size(); ++i) {
        row_.push_back(read_column(static_cast<SQLUSMALLINT>(i + 1), columns_[i].sql_type));
    }
}

SqlValue OdbcResultCursor::read_column(SQLUSMALLINT number, SQLSMALLINT sql_type) {
    SQLHSTMT handle = stmt_.get_handle();

    auto fixed = [&](auto value, SQLSMALLINT c_type) -> SqlValue {
        SQLLEN indicator = 0;
        SQLRETURN ret = call_blocking([&]() {
            return SQLGetData(handle, number, c_type, &value, sizeof(value), &indicator);
        });
        check_odbc_result(ret, SQL_HANDLE_STMT, handle, "SQLGetData");
        if (indicator == SQL_NULL_DATA) {
            return SqlValue{};
        }
        return SqlValue(value);
    };

    switch (sql_type) {
        case SQL_BIGINT:
            return fixed(int64_t{0}, SQL_C_SBIGINT);
        case SQL_INTEGER:
        case SQL_SMALLINT:
            return fixed(int32_t{0}, SQL_C_SLONG);
        case SQL_TINYINT:
            return fixed(uint8_t{0}, SQL_C_UTINYINT);
        case SQL_REAL:
            return fixed(0.0f, SQL_C_FLOAT);
        case SQL_FLOAT:
        case SQL_DOUBLE:
            return fixed(0.0, SQL_C_DOUBLE);
        case SQL_BIT: {
            SqlValue bit = fixed(static_cast<unsigned char>(0), SQL_C_BIT);
            if (data::is_null(bit)) {
                return bit;
            }
            // unsigned char is stored as the Byte alternative
            return SqlValue(std::get<uint8_t>(bit) != 0);
        }
        case SQL_TYPE_TIMESTAMP:
        case SQL_TYPE_DATE:
        case SQL_TIMESTAMP:
        case SQL_DATE: {
            SQL_TIMESTAMP_STRUCT ts{};
            SQLLEN indicator = 0;
            SQLRETURN ret = call_blocking([&]() {
                return SQLGetData(handle, number, SQL_C_TYPE_TIMESTAMP, &ts, sizeof(ts), &indicator);
            });
            check_odbc_result(ret, SQL_HANDLE_STMT, handle, "SQLGetData");
            if (indicator == SQL_NULL_DATA) {
                return SqlValue{};
            }
            return SqlValue(from_timestamp(ts));
        }
        case SQL_DECIMAL:
        case SQL_NUMERIC: {
            SqlValue text = read_text(number);
            if (data::is_null(text)) {
                return text;
            }
            return SqlValue(data::Decimal{std::get<std::string>(text)});
        }
        default:
            return read_text(number);
    }
}

SqlValue OdbcResultCursor::read_text(SQLUSMALLINT number) {
    SQLHSTMT handle = stmt_.get_handle();
    std::string result;
    char buffer[kTextChunk];

    for (;;) {
        SQLLEN indicator = 0;
        SQLRETURN ret = call_blocking([&]() {
            return SQLGetData(handle, number, SQL_C_CHAR, buffer, sizeof(buffer), &indicator);
        });
        if (ret == SQL_NO_DATA) {
            break;
        }
        check_odbc_result(ret, SQL_HANDLE_STMT, handle, "SQLGetData");
        if (indicator == SQL_NULL_DATA) {
            return SqlValue{};
        }

        size_t chunk = (indicator == SQL_NO_TOTAL || indicator >= static_cast<SQLLEN>(sizeof(buffer)))
                           ? sizeof(buffer) - 1
                           : static_cast<size_t>(indicator);
        result.append(buffer, chunk);

        // SQL_SUCCESS_WITH_INFO (01004) means the value was truncated
        if (ret == SQL_SUCCESS) {
            break;
        }
    }
    return SqlValue(std::move(result));
}

// OdbcCommand

OdbcCommand::OdbcCommand(OdbcConnection& conn, data::CommandDefinition definition)
    : stmt_(conn), definition_(std::move(definition)) {
}

OdbcCommand::~OdbcCommand() {
    cursor_.reset();
    if (phase_ != Phase::Idle && phase_ != Phase::Done) {
        stmt_.close_cursor();
    }
}

void OdbcCommand::prepare(const std::vector<data::QueryParameterPtr>& params) {
    if (phase_ != Phase::Idle) {
        throw InvalidStateError("Command has already been executed");
    }

    stmt_.recycle();
    if (definition_.timeout_seconds > 0) {
        stmt_.set_query_timeout(definition_.timeout_seconds);
    }

    std::vector<data::QueryParameterPtr> ordered;
    if (definition_.type == data::CommandType::StoredProcedure) {
        auto ret_param = std::find_if(params.begin(), params.end(), [](const data::QueryParameterPtr& p) {
            return p->direction == ParameterDirection::ReturnValue;
        });
        if (ret_param != params.end()) {
            ordered.push_back(*ret_param);
        }
        for (const auto& param : params) {
            if (param->direction != ParameterDirection::ReturnValue) {
                ordered.push_back(param);
            }
        }
        bool has_return = ret_param != params.end();
        sql_ = build_call_escape(definition_.text, ordered.size() - (has_return ? 1 : 0), has_return);
    } else {
        std::vector<std::string> names;
        for (const auto& param : params) {
            if (param->direction == ParameterDirection::ReturnValue) {
                LOG_DEBUG("Return value @" + param->name + " ignored for a text command");
                continue;
            }
            names.push_back(param->name);
        }

        MarkerRewrite rewrite = rewrite_named_markers(definition_.text, names);
        sql_ = std::move(rewrite.sql);
        for (const auto& marker : rewrite.markers) {
            auto it = std::find_if(params.begin(), params.end(), [&](const data::QueryParameterPtr& p) {
                return p->direction != ParameterDirection::ReturnValue && iequals(p->name, marker);
            });
            ordered.push_back(*it);
        }
        if (ordered.size() < names.size()) {
            LOG_DEBUG("Some parameters are not referenced by the command text");
        }
    }

    LOG_DEBUG("SQL: " + sql_);

    buffers_.clear();
    for (size_t i = 0; i < ordered.size(); ++i) {
        bind(ordered[i], static_cast<SQLUSMALLINT>(i + 1));
    }
}

void OdbcCommand::bind(const data::QueryParameterPtr& param, SQLUSMALLINT number) {
    auto buffer = std::make_unique<ParamBuffer>();
    ParamBuffer& b = *buffer;
    b.param = param;

    const bool sends = param->direction == ParameterDirection::Input ||
                       param->direction == ParameterDirection::InputOutput;
    const bool null = !sends || data::is_null(param->value);

    auto text_buffer = [&](const std::string& text, size_t minimum) {
        size_t capacity = std::max({text.size(), static_cast<size_t>(std::max(param->size, 0)), minimum});
        b.data.assign(capacity + 1, '\0');
        std::copy(text.begin(), text.end(), b.data.begin());
        b.indicator = static_cast<SQLLEN>(text.size());
        b.column_size = std::max<SQLULEN>(capacity, 1);
    };

    switch (param->type) {
        case DbType::Int64:
            store(b.data, null ? int64_t{0} : data::value_cast<int64_t>(param->value));
            b.c_type = SQL_C_SBIGINT;
            b.sql_type = SQL_BIGINT;
            break;
        case DbType::Int32:
            store(b.data, null ? int32_t{0} : data::value_cast<int32_t>(param->value));
            b.c_type = SQL_C_SLONG;
            b.sql_type = SQL_INTEGER;
            break;
        case DbType::Byte:
            store(b.data, null ? uint8_t{0} : data::value_cast<uint8_t>(param->value));
            b.c_type = SQL_C_UTINYINT;
            b.sql_type = SQL_TINYINT;
            break;
        case DbType::Single:
            store(b.data, null ? 0.0f : data::value_cast<float>(param->value));
            b.c_type = SQL_C_FLOAT;
            b.sql_type = SQL_REAL;
            break;
        case DbType::Double:
            store(b.data, null ? 0.0 : data::value_cast<double>(param->value));
            b.c_type = SQL_C_DOUBLE;
            b.sql_type = SQL_DOUBLE;
            break;
        case DbType::Boolean:
            store(b.data, static_cast<unsigned char>(!null && data::value_cast<bool>(param->value)));
            b.c_type = SQL_C_BIT;
            b.sql_type = SQL_BIT;
            break;
        case DbType::DateTime:
            store(b.data, to_timestamp(null ? data::DateTime{} : data::value_cast<data::DateTime>(param->value)));
            b.c_type = SQL_C_TYPE_TIMESTAMP;
            b.sql_type = SQL_TYPE_TIMESTAMP;
            b.column_size = 27;
            b.decimal_digits = 7;
            break;
        case DbType::Char:
            text_buffer(null ? std::string() : std::string(1, data::value_cast<char>(param->value)), 1);
            b.c_type = SQL_C_CHAR;
            b.sql_type = SQL_CHAR;
            break;
        case DbType::Decimal: {
            std::string digits = null ? std::string() : data::value_cast<data::Decimal>(param->value).digits;
            text_buffer(digits, 40);
            b.c_type = SQL_C_CHAR;
            b.sql_type = SQL_DECIMAL;
            b.column_size = param->precision > 0 ? param->precision : 38;
            b.decimal_digits = param->precision > 0 ? param->scale : scale_of(digits);
            break;
        }
        case DbType::String:
            text_buffer(null ? std::string() : data::value_cast<std::string>(param->value),
                        param->is_output() ? kDefaultOutputTextSize : 0);
            b.c_type = SQL_C_CHAR;
            b.sql_type = SQL_VARCHAR;
            break;
    }

    if (null) {
        b.indicator = SQL_NULL_DATA;
    } else if (b.c_type != SQL_C_CHAR) {
        b.indicator = static_cast<SQLLEN>(b.data.size());
    }

    SQLRETURN ret = SQLBindParameter(stmt_.get_handle(), number, io_type(param->direction),
                                     b.c_type, b.sql_type, b.column_size, b.decimal_digits,
                                     b.data.data(), static_cast<SQLLEN>(b.data.size()), &b.indicator);
    check_odbc_result(ret, SQL_HANDLE_STMT, stmt_.get_handle(),
                      "SQLBindParameter(@" + param->name + ")");
    buffers_.push_back(std::move(buffer));
}

void OdbcCommand::publish_outputs() {
    for (const auto& buffer : buffers_) {
        const ParamBuffer& b = *buffer;
        data::QueryParameter& param = *b.param;
        if (!param.is_output()) {
            continue;
        }
        if (b.indicator == SQL_NULL_DATA) {
            param.value = SqlValue{};
            continue;
        }

        switch (param.type) {
            case DbType::Int64:    param.value = load<int64_t>(b.data); break;
            case DbType::Int32:    param.value = load<int32_t>(b.data); break;
            case DbType::Byte:     param.value = load<uint8_t>(b.data); break;
            case DbType::Single:   param.value = load<float>(b.data); break;
            case DbType::Double:   param.value = load<double>(b.data); break;
            case DbType::Boolean:  param.value = load<unsigned char>(b.data) != 0; break;
            case DbType::DateTime: param.value = from_timestamp(load<SQL_TIMESTAMP_STRUCT>(b.data)); break;
            case DbType::Char:
            case DbType::Decimal:
            case DbType::String: {
                size_t length = std::min(static_cast<size_t>(std::max<SQLLEN>(b.indicator, 0)),
                                         b.data.size() - 1);
                std::string text(b.data.data(), length);
                if (param.type == DbType::Char) {
                    param.value = text.empty() ? SqlValue{} : SqlValue(text.front());
                } else if (param.type == DbType::Decimal) {
                    param.value = data::Decimal{text};
                } else {
                    param.value = std::move(text);
                }
                break;
            }
        }
        LOG_TRACE("Output @" + param.name + " = " + data::to_string(param.value));
    }
}

PollStatus OdbcCommand::skip_to_rows(bool& has_rows) {
    for (;;) {
        if (!awaiting_more_) {
            if (stmt_.column_count() > 0) {
                has_rows = true;
                return PollStatus::Ready;
            }
            awaiting_more_ = true;
        }
        bool more = false;
        if (stmt_.poll_more_results(more) == PollStatus::Pending) {
            return PollStatus::Pending;
        }
        awaiting_more_ = false;
        if (!more) {
            has_rows = false;
            return PollStatus::Ready;
        }
    }
}

PollStatus OdbcCommand::drain() {
    for (;;) {
        bool more = false;
        if (stmt_.poll_more_results(more) == PollStatus::Pending) {
            return PollStatus::Pending;
        }
        if (!more) {
            return PollStatus::Ready;
        }
    }
}

data::ResultCursor& OdbcCommand::execute_reader(const std::vector<data::QueryParameterPtr>& params) {
    prepare(params);
    phase_ = Phase::Executing;

    bool has_rows = stmt_.execute(sql_);
    if (has_rows) {
        phase_ = Phase::Skipping;
        data::AsyncOperation<void>([this, &has_rows]() { return skip_to_rows(has_rows); }).wait();
    }
    cursor_ = std::make_unique<OdbcResultCursor>(stmt_, has_rows);
    phase_ = Phase::Open;
    return *cursor_;
}

PollStatus OdbcCommand::execute_reader_async(const std::vector<data::QueryParameterPtr>& params,
                                             data::ResultCursor*& cursor) {
    if (phase_ == Phase::Idle) {
        prepare(params);
        stmt_.enable_async();
        phase_ = Phase::Executing;
    }

    if (phase_ == Phase::Executing) {
        bool has_result = false;
        if (stmt_.poll_execute(sql_, has_result) == PollStatus::Pending) {
            return PollStatus::Pending;
        }
        if (!has_result) {
            cursor_ = std::make_unique<OdbcResultCursor>(stmt_, false);
            phase_ = Phase::Open;
        } else {
            phase_ = Phase::Skipping;
        }
    }

    if (phase_ == Phase::Skipping) {
        bool has_rows = false;
        if (skip_to_rows(has_rows) == PollStatus::Pending) {
            return PollStatus::Pending;
        }
        cursor_ = std::make_unique<OdbcResultCursor>(stmt_, has_rows);
        phase_ = Phase::Open;
    }

    cursor = cursor_.get();
    return PollStatus::Ready;
}

int64_t OdbcCommand::execute_non_query(const std::vector<data::QueryParameterPtr>& params) {
    prepare(params);
    phase_ = Phase::Executing;

    if (stmt_.execute(sql_)) {
        affected_rows_ = stmt_.row_count();
        phase_ = Phase::Draining;
        data::AsyncOperation<void>([this]() { return drain(); }).wait();
    } else {
        affected_rows_ = 0;
    }

    phase_ = Phase::Done;
    stmt_.close_cursor();
    publish_outputs();
    return affected_rows_;
}

PollStatus OdbcCommand::execute_non_query_async(const std::vector<data::QueryParameterPtr>& params,
                                                int64_t& affected_rows) {
    if (phase_ == Phase::Idle) {
        prepare(params);
        stmt_.enable_async();
        phase_ = Phase::Executing;
    }

    if (phase_ == Phase::Executing) {
        bool has_result = false;
        if (stmt_.poll_execute(sql_, has_result) == PollStatus::Pending) {
            return PollStatus::Pending;
        }
        // SQL_NO_DATA: a searched UPDATE or DELETE that matched nothing
        affected_rows_ = has_result ? stmt_.row_count() : 0;
        phase_ = has_result ? Phase::Draining : Phase::Done;
    }

    if (phase_ == Phase::Draining) {
        if (drain() == PollStatus::Pending) {
            return PollStatus::Pending;
        }
        phase_ = Phase::Done;
    }

    stmt_.close_cursor();
    publish_outputs();
    affected_rows = affected_rows_;
    return PollStatus::Ready;
}

void OdbcCommand::cancel() {
    cancelled_ = true;
    LOG_DEBUG("SQLCancel on: " + sql_);
    stmt_.cancel();
}

void OdbcCommand::close_cursor() {
    if (phase_ != Phase::Open) {
        return;
    }
    cursor_.reset();

    if (cancelled_) {
        // Results of a cancelled statement are discarded, outputs never arrive
        stmt_.close_cursor();
        phase_ = Phase::Done;
        return;
    }

    // Output parameters arrive after the last result
    phase_ = Phase::Draining;
    data::AsyncOperation<void>([this]() { return drain(); }).wait();
    stmt_.close_cursor();
    phase_ = Phase::Done;
    publish_outputs();
}

} // namespace sqlgraph::core
