#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <type_traits>
#include <limits>

namespace sqlgraph::data {

// Date and time with fractional seconds in nanoseconds
struct DateTime {
    int16_t year = 1900;
    uint16_t month = 1;
    uint16_t day = 1;
    uint16_t hour = 0;
    uint16_t minute = 0;
    uint16_t second = 0;
    uint32_t fraction = 0;

    bool operator==(const DateTime& other) const noexcept;
    bool operator!=(const DateTime& other) const noexcept { return !(*this == other); }
};

// Exact numeric kept in its textual form ("-123.4500")
struct Decimal {
    std::string digits;

    bool operator==(const Decimal& other) const noexcept { return digits == other.digits; }
    bool operator!=(const Decimal& other) const noexcept { return !(*this == other); }
};

// std::monostate is SQL NULL
using SqlValue = std::variant<
    std::monostate,
    int64_t,
    int32_t,
    uint8_t,
    std::string,
    float,
    double,
    bool,
    char,
    DateTime,
    Decimal>;

enum class DbType {
    Int64,
    Int32,
    Byte,
    String,
    Single,
    Double,
    Boolean,
    Char,
    DateTime,
    Decimal
};

inline bool is_null(const SqlValue& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

// Declared type for a value's runtime kind; null declares String
DbType db_type_of(const SqlValue& value) noexcept;

const char* db_type_name(DbType type) noexcept;

// Textual representation; null renders as the empty string
std::string to_string(const SqlValue& value);
std::string to_string(const DateTime& value);

// Parses "YYYY-MM-DD[ HH:MM:SS[.fffffffff]]" (a 'T' separator is accepted)
std::optional<DateTime> parse_date_time(const std::string& text);

// Scalar kinds a SqlValue can hold, excluding null
template<typename T>
struct is_sql_scalar
    : std::bool_constant<
          std::is_same_v<T, int64_t> || std::is_same_v<T, int32_t> ||
          std::is_same_v<T, uint8_t> || std::is_same_v<T, std::string> ||
          std::is_same_v<T, float> || std::is_same_v<T, double> ||
          std::is_same_v<T, bool> || std::is_same_v<T, char> ||
          std::is_same_v<T, DateTime> || std::is_same_v<T, Decimal>> {};

template<typename T>
inline constexpr bool is_sql_scalar_v = is_sql_scalar<T>::value;

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template<typename T>
constexpr DbType db_type_for() noexcept {
    if constexpr (std::is_same_v<T, int64_t>) return DbType::Int64;
    else if constexpr (std::is_same_v<T, int32_t>) return DbType::Int32;
    else if constexpr (std::is_same_v<T, uint8_t>) return DbType::Byte;
    else if constexpr (std::is_same_v<T, float>) return DbType::Single;
    else if constexpr (std::is_same_v<T, double>) return DbType::Double;
    else if constexpr (std::is_same_v<T, bool>) return DbType::Boolean;
    else if constexpr (std::is_same_v<T, char>) return DbType::Char;
    else if constexpr (std::is_same_v<T, DateTime>) return DbType::DateTime;
    else if constexpr (std::is_same_v<T, Decimal>) return DbType::Decimal;
    else return DbType::String;
}

namespace detail {

int64_t to_int64(const SqlValue& value, const char* target);
double to_double(const SqlValue& value, const char* target);
bool to_bool(const SqlValue& value);
char to_char(const SqlValue& value);
DateTime to_date_time(const SqlValue& value);
Decimal to_decimal(const SqlValue& value);
int64_t checked_narrow(int64_t value, int64_t min, int64_t max, const char* target);

} // namespace detail

// Converts a non-null value to T. Throws core::TypeConversionError when the
// value cannot be represented. Null handling is left to the caller.
template<typename T>
T value_cast(const SqlValue& value) {
    if constexpr (is_optional_v<T>) {
        if (is_null(value)) {
            return std::nullopt;
        }
        return value_cast<typename T::value_type>(value);
    } else if constexpr (std::is_same_v<T, SqlValue>) {
        return value;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return to_string(value);
    } else if constexpr (std::is_same_v<T, bool>) {
        return detail::to_bool(value);
    } else if constexpr (std::is_same_v<T, char>) {
        return detail::to_char(value);
    } else if constexpr (std::is_same_v<T, DateTime>) {
        return detail::to_date_time(value);
    } else if constexpr (std::is_same_v<T, Decimal>) {
        return detail::to_decimal(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(detail::to_double(value, "floating point"));
    } else if constexpr (std::is_integral_v<T>) {
        int64_t wide = detail::to_int64(value, "integer");
        if constexpr (sizeof(T) < sizeof(int64_t) || std::is_unsigned_v<T>) {
            wide = detail::checked_narrow(
                wide,
                static_cast<int64_t>(std::numeric_limits<T>::min()),
                std::is_unsigned_v<T> && sizeof(T) >= sizeof(int64_t)
                    ? std::numeric_limits<int64_t>::max()
                    : static_cast<int64_t>(std::numeric_limits<T>::max()),
                "integer");
        }
        return static_cast<T>(wide);
    } else {
        static_assert(std::is_same_v<T, void>, "value_cast: unsupported target type");
    }
}

} // namespace sqlgraph::data
