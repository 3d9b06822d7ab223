#include "parameter_binder.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cctype>

namespace sqlgraph::data {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // anonymous namespace

const char* direction_name(ParameterDirection direction) noexcept {
    switch (direction) {
        case ParameterDirection::Input: return "Input";
        case ParameterDirection::Output: return "Output";
        case ParameterDirection::InputOutput: return "InputOutput";
        case ParameterDirection::ReturnValue: return "ReturnValue";
        default: return "Unknown";
    }
}

ParameterBag::ParameterBag(std::initializer_list<std::pair<std::string, SqlValue>> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

ParameterBag& ParameterBag::set(const std::string& name, SqlValue value) {
    DbType type = db_type_of(value);
    return set(name, std::move(value), type, false);
}

ParameterBag& ParameterBag::set(const std::string& name, SqlValue value, DbType type, bool nullable) {
    core::require_name(name, "Parameter name");

    for (auto& entry : entries_) {
        if (entry.name == name) {
            entry.value = std::move(value);
            entry.type = type;
            entry.nullable = nullable;
            return *this;
        }
    }
    entries_.push_back(Entry{name, std::move(value), type, nullable});
    return *this;
}

const ParameterBag::Entry* ParameterBag::find(std::string_view name) const noexcept {
    for (const auto& entry : entries_) {
        if (iequals(entry.name, name)) {
            return &entry;
        }
    }
    return nullptr;
}

ParameterBag ParameterBag::with_prefix(const std::string& prefix) const {
    ParameterBag result;
    result.entries_.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.entries_.push_back(Entry{prefix + entry.name, entry.value, entry.type, entry.nullable});
    }
    return result;
}

std::vector<QueryParameter> ParameterBinder::bind(const ParameterBag& bag) {
    std::vector<QueryParameter> params;
    params.reserve(bag.size());

    for (const auto& entry : bag) {
        QueryParameter param;
        param.name = entry.name;
        param.value = entry.value;
        param.type = entry.type;
        param.nullable = entry.nullable || is_null(entry.value);
        param.direction = ParameterDirection::Input;
        params.push_back(std::move(param));
    }

    LOG_TRACE("Bound " + std::to_string(params.size()) + " parameters");
    return params;
}

} // namespace sqlgraph::data
