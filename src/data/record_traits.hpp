#pragma once

#include "value.hpp"
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace sqlgraph::data {

// One public field of a record type: its name and member pointer
template<typename Record, typename Member>
struct Field {
    const char* name;
    Member Record::*member;
};

template<typename Record, typename Member>
constexpr Field<Record, Member> field(const char* name, Member Record::*member) {
    return Field<Record, Member>{name, member};
}

// Specialize for every record type that is mapped from result rows or used
// as a parameter source:
//
//   template<> struct RecordTraits<Person> {
//       static auto fields() {
//           return std::make_tuple(field("id", &Person::id),
//                                  field("name", &Person::name));
//       }
//   };
template<typename T>
struct RecordTraits;

template<typename T, typename = void>
struct has_record_traits : std::false_type {};

template<typename T>
struct has_record_traits<T, std::void_t<decltype(RecordTraits<T>::fields())>> : std::true_type {};

template<typename T>
inline constexpr bool has_record_traits_v = has_record_traits<T>::value;

template<typename T, typename Func>
void for_each_field(Func&& func) {
    std::apply([&](const auto&... fields) { (func(fields), ...); },
               RecordTraits<T>::fields());
}

template<typename T, typename = void>
struct is_streamable : std::false_type {};

template<typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

// Binding-side description of a C++ member type: declared DbType, whether
// it is a nullable wrapper, and how a value of it becomes a SqlValue.
// Types outside the scalar set bind as their textual representation.
template<typename M>
struct SqlTypeOf {
    static constexpr bool nullable = false;
    static constexpr DbType type = db_type_for<M>();

    static SqlValue to_value(const M& value) {
        if constexpr (is_sql_scalar_v<M>) {
            return SqlValue(value);
        } else if constexpr (std::is_convertible_v<const M&, std::string>) {
            return SqlValue(std::string(value));
        } else {
            static_assert(is_streamable<M>::value,
                          "parameter type needs operator<< for its textual representation");
            std::ostringstream oss;
            oss << value;
            return SqlValue(oss.str());
        }
    }
};

template<typename M>
struct SqlTypeOf<std::optional<M>> {
    static constexpr bool nullable = true;
    static constexpr DbType type = SqlTypeOf<M>::type;

    static SqlValue to_value(const std::optional<M>& value) {
        if (!value) {
            return SqlValue{};
        }
        return SqlTypeOf<M>::to_value(*value);
    }
};

// Assigns a result value to a record member; SQL null assigns the member's
// zero value (std::nullopt for optionals)
template<typename M>
void assign_member(M& target, const SqlValue& value) {
    if (is_null(value)) {
        target = M{};
    } else {
        target = value_cast<M>(value);
    }
}

} // namespace sqlgraph::data
