#pragma once

#include "query_parameter.hpp"
#include "record_traits.hpp"
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlgraph::data {

// Ordered name -> value map used as a loosely-typed parameter source.
// Enumeration order is insertion order; generated column and value lists
// follow it.
class ParameterBag {
public:
    struct Entry {
        std::string name;
        SqlValue value;
        DbType type = DbType::String;
        bool nullable = false;
    };

    using const_iterator = std::vector<Entry>::const_iterator;

    ParameterBag() = default;
    ParameterBag(std::initializer_list<std::pair<std::string, SqlValue>> entries);

    // Declared type follows the value's runtime kind
    ParameterBag& set(const std::string& name, SqlValue value);
    // Declared type given explicitly (typed record fields, nullable wrappers)
    ParameterBag& set(const std::string& name, SqlValue value, DbType type, bool nullable);

    // Case-insensitive lookup
    const Entry* find(std::string_view name) const noexcept;
    bool contains(std::string_view name) const noexcept { return find(name) != nullptr; }

    bool empty() const noexcept { return entries_.empty(); }
    size_t size() const noexcept { return entries_.size(); }
    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    // Copy of this bag with every name prefixed (used to keep two bags
    // bound into one command apart)
    ParameterBag with_prefix(const std::string& prefix) const;

private:
    std::vector<Entry> entries_;
};

// Builds a ParameterBag from a record type's traits. Members of scalar kinds
// keep their type; std::optional members are tagged nullable; other types
// bind as text.
template<typename T>
ParameterBag make_parameter_bag(const T& record) {
    static_assert(has_record_traits_v<T>, "record type needs a RecordTraits specialization");
    ParameterBag bag;
    for_each_field<T>([&](const auto& f) {
        using Member = std::decay_t<decltype(record.*(f.member))>;
        bag.set(f.name, SqlTypeOf<Member>::to_value(record.*(f.member)),
                SqlTypeOf<Member>::type, SqlTypeOf<Member>::nullable);
    });
    return bag;
}

// Converts any supported parameter source to an optional bag. A null
// source (nullptr, empty pointer or empty optional) yields std::nullopt.
inline std::optional<ParameterBag> to_parameter_bag(std::nullptr_t) {
    return std::nullopt;
}

inline std::optional<ParameterBag> to_parameter_bag(const ParameterBag& bag) {
    return bag;
}

inline std::optional<ParameterBag> to_parameter_bag(const std::optional<ParameterBag>& bag) {
    return bag;
}

template<typename T, typename = std::enable_if_t<has_record_traits_v<T>>>
std::optional<ParameterBag> to_parameter_bag(const T& record) {
    return make_parameter_bag(record);
}

template<typename T>
std::optional<ParameterBag> to_parameter_bag(const T* source) {
    if (!source) {
        return std::nullopt;
    }
    return to_parameter_bag(*source);
}

template<typename T>
std::optional<ParameterBag> to_parameter_bag(const std::optional<T>& source) {
    if (!source) {
        return std::nullopt;
    }
    return to_parameter_bag(*source);
}

// Turns a parameter source into input QueryParameters, one per entry
class ParameterBinder {
public:
    static std::vector<QueryParameter> bind(const ParameterBag& bag);

    template<typename T>
    static std::vector<QueryParameter> bind(const T& source) {
        auto bag = to_parameter_bag(source);
        if (!bag) {
            return {};
        }
        return bind(*bag);
    }
};

} // namespace sqlgraph::data
