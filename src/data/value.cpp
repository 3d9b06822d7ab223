#include "value.hpp"
#include "core/errors.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <iomanip>

namespace sqlgraph::data {

namespace {

std::string kind_name(const SqlValue& value) {
    if (is_null(value)) {
        return "NULL";
    }
    return db_type_name(db_type_of(value));
}

[[noreturn]] void conversion_failed(const SqlValue& value, const char* target) {
    throw core::TypeConversionError(
        "Cannot convert " + kind_name(value) + " value '" + to_string(value) + "' to " + target);
}

std::string format_double(double value) {
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    return oss.str();
}

std::string format_float(float value) {
    std::ostringstream oss;
    oss << std::setprecision(9) << value;
    return oss.str();
}

} // anonymous namespace

bool DateTime::operator==(const DateTime& other) const noexcept {
    return year == other.year && month == other.month && day == other.day &&
           hour == other.hour && minute == other.minute && second == other.second &&
           fraction == other.fraction;
}

DbType db_type_of(const SqlValue& value) noexcept {
    switch (value.index()) {
        case 1: return DbType::Int64;
        case 2: return DbType::Int32;
        case 3: return DbType::Byte;
        case 4: return DbType::String;
        case 5: return DbType::Single;
        case 6: return DbType::Double;
        case 7: return DbType::Boolean;
        case 8: return DbType::Char;
        case 9: return DbType::DateTime;
        case 10: return DbType::Decimal;
        default: return DbType::String;
    }
}

const char* db_type_name(DbType type) noexcept {
    switch (type) {
        case DbType::Int64: return "Int64";
        case DbType::Int32: return "Int32";
        case DbType::Byte: return "Byte";
        case DbType::String: return "String";
        case DbType::Single: return "Single";
        case DbType::Double: return "Double";
        case DbType::Boolean: return "Boolean";
        case DbType::Char: return "Char";
        case DbType::DateTime: return "DateTime";
        case DbType::Decimal: return "Decimal";
        default: return "Unknown";
    }
}

std::string to_string(const DateTime& value) {
    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u %02u:%02u:%02u",
                  static_cast<int>(value.year), value.month, value.day,
                  value.hour, value.minute, value.second);
    std::string text(buffer);
    if (value.fraction != 0) {
        // Nanoseconds, trailing zeros trimmed
        std::snprintf(buffer, sizeof(buffer), ".%09u", value.fraction);
        std::string frac(buffer);
        while (frac.back() == '0') {
            frac.pop_back();
        }
        text += frac;
    }
    return text;
}

std::string to_string(const SqlValue& value) {
    switch (value.index()) {
        case 0: return "";
        case 1: return std::to_string(std::get<int64_t>(value));
        case 2: return std::to_string(std::get<int32_t>(value));
        case 3: return std::to_string(static_cast<unsigned>(std::get<uint8_t>(value)));
        case 4: return std::get<std::string>(value);
        case 5: return format_float(std::get<float>(value));
        case 6: return format_double(std::get<double>(value));
        case 7: return std::get<bool>(value) ? "true" : "false";
        case 8: return std::string(1, std::get<char>(value));
        case 9: return to_string(std::get<DateTime>(value));
        case 10: return std::get<Decimal>(value).digits;
        default: return "";
    }
}

std::optional<DateTime> parse_date_time(const std::string& text) {
    int year = 0;
    unsigned month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char separator = ' ';
    int consumed = 0;

    int fields = std::sscanf(text.c_str(), "%d-%u-%u%c%u:%u:%u%n",
                             &year, &month, &day, &separator, &hour, &minute, &second, &consumed);
    if (fields == 3) {
        hour = minute = second = 0;
        // Date only: reject trailing garbage
        int date_len = 0;
        std::sscanf(text.c_str(), "%*d-%*u-%*u%n", &date_len);
        if (static_cast<size_t>(date_len) != text.size()) {
            return std::nullopt;
        }
    } else if (fields != 7 || (separator != ' ' && separator != 'T')) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return std::nullopt;
    }

    DateTime result;
    result.year = static_cast<int16_t>(year);
    result.month = static_cast<uint16_t>(month);
    result.day = static_cast<uint16_t>(day);
    result.hour = static_cast<uint16_t>(hour);
    result.minute = static_cast<uint16_t>(minute);
    result.second = static_cast<uint16_t>(second);

    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        std::string digits;
        for (++pos; pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])); ++pos) {
            if (digits.size() < 9) {
                digits += text[pos];
            }
        }
        digits.append(9 - digits.size(), '0');
        result.fraction = static_cast<uint32_t>(std::stoul(digits));
    }
    if (pos != text.size()) {
        return std::nullopt;
    }
    return result;
}

namespace detail {

int64_t to_int64(const SqlValue& value, const char* target) {
    switch (value.index()) {
        case 1: return std::get<int64_t>(value);
        case 2: return std::get<int32_t>(value);
        case 3: return std::get<uint8_t>(value);
        case 5:
        case 6: {
            double d = value.index() == 5 ? std::get<float>(value) : std::get<double>(value);
            if (!std::isfinite(d) || d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
                conversion_failed(value, target);
            }
            return static_cast<int64_t>(d);
        }
        case 7: return std::get<bool>(value) ? 1 : 0;
        case 4:
        case 10: {
            const std::string& text = value.index() == 4
                ? std::get<std::string>(value)
                : std::get<Decimal>(value).digits;
            errno = 0;
            char* end = nullptr;
            long long parsed = std::strtoll(text.c_str(), &end, 10);
            if (text.empty() || errno == ERANGE) {
                conversion_failed(value, target);
            }
            // Decimal "12.000" is still an integer
            if (*end == '.') {
                const char* rest = end + 1;
                while (*rest == '0') {
                    ++rest;
                }
                if (*rest != '\0') {
                    conversion_failed(value, target);
                }
            } else if (*end != '\0') {
                conversion_failed(value, target);
            }
            return parsed;
        }
        default:
            conversion_failed(value, target);
    }
}

double to_double(const SqlValue& value, const char* target) {
    switch (value.index()) {
        case 1: return static_cast<double>(std::get<int64_t>(value));
        case 2: return std::get<int32_t>(value);
        case 3: return std::get<uint8_t>(value);
        case 5: return std::get<float>(value);
        case 6: return std::get<double>(value);
        case 7: return std::get<bool>(value) ? 1.0 : 0.0;
        case 4:
        case 10: {
            const std::string& text = value.index() == 4
                ? std::get<std::string>(value)
                : std::get<Decimal>(value).digits;
            char* end = nullptr;
            double parsed = std::strtod(text.c_str(), &end);
            if (text.empty() || *end != '\0') {
                conversion_failed(value, target);
            }
            return parsed;
        }
        default:
            conversion_failed(value, target);
    }
}

bool to_bool(const SqlValue& value) {
    switch (value.index()) {
        case 7: return std::get<bool>(value);
        case 1:
        case 2:
        case 3: return to_int64(value, "Boolean") != 0;
        case 4: {
            const std::string& text = std::get<std::string>(value);
            if (text == "1" || text == "true" || text == "True" || text == "TRUE") {
                return true;
            }
            if (text == "0" || text == "false" || text == "False" || text == "FALSE") {
                return false;
            }
            conversion_failed(value, "Boolean");
        }
        default:
            conversion_failed(value, "Boolean");
    }
}

char to_char(const SqlValue& value) {
    if (std::holds_alternative<char>(value)) {
        return std::get<char>(value);
    }
    if (std::holds_alternative<std::string>(value) && std::get<std::string>(value).size() == 1) {
        return std::get<std::string>(value)[0];
    }
    conversion_failed(value, "Char");
}

DateTime to_date_time(const SqlValue& value) {
    if (std::holds_alternative<DateTime>(value)) {
        return std::get<DateTime>(value);
    }
    if (std::holds_alternative<std::string>(value)) {
        auto parsed = parse_date_time(std::get<std::string>(value));
        if (parsed) {
            return *parsed;
        }
    }
    conversion_failed(value, "DateTime");
}

Decimal to_decimal(const SqlValue& value) {
    switch (value.index()) {
        case 10: return std::get<Decimal>(value);
        case 1:
        case 2:
        case 3:
        case 5:
        case 6: return Decimal{to_string(value)};
        case 4: {
            // Validate the text is numeric before accepting it
            to_double(value, "Decimal");
            return Decimal{std::get<std::string>(value)};
        }
        default:
            conversion_failed(value, "Decimal");
    }
}

int64_t checked_narrow(int64_t value, int64_t min, int64_t max, const char* target) {
    if (value < min || value > max) {
        throw core::TypeConversionError(
            "Value " + std::to_string(value) + " is out of range for " + target);
    }
    return value;
}

} // namespace detail

} // namespace sqlgraph::data
