#include "json_parameters.hpp"
#include "core/errors.hpp"
#include <limits>

namespace sqlgraph::cli {

data::SqlValue value_from_json(const nlohmann::ordered_json& value) {
    switch (value.type()) {
        case nlohmann::ordered_json::value_t::null:
            return data::SqlValue{};
        case nlohmann::ordered_json::value_t::boolean:
            return data::SqlValue(value.get<bool>());
        case nlohmann::ordered_json::value_t::number_integer:
        case nlohmann::ordered_json::value_t::number_unsigned: {
            if (value.is_number_unsigned() &&
                value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw core::ContractViolation("Integer " + value.dump() + " is out of range");
            }
            int64_t number = value.get<int64_t>();
            if (number >= std::numeric_limits<int32_t>::min() &&
                number <= std::numeric_limits<int32_t>::max()) {
                return data::SqlValue(static_cast<int32_t>(number));
            }
            return data::SqlValue(number);
        }
        case nlohmann::ordered_json::value_t::number_float:
            return data::SqlValue(value.get<double>());
        case nlohmann::ordered_json::value_t::string:
            return data::SqlValue(value.get<std::string>());
        default:
            throw core::ContractViolation("Parameter values must be JSON scalars, got " +
                                          std::string(value.type_name()));
    }
}

std::optional<data::ParameterBag> bag_from_json(const nlohmann::ordered_json& document) {
    if (document.is_null()) {
        return std::nullopt;
    }
    if (!document.is_object()) {
        throw core::ContractViolation("Parameters must be a JSON object");
    }

    data::ParameterBag bag;
    for (const auto& item : document.items()) {
        core::require_name(item.key(), "Parameter name");
        bag.set(item.key(), value_from_json(item.value()));
    }
    return bag;
}

std::optional<data::ParameterBag> parse_bag(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    try {
        return bag_from_json(nlohmann::ordered_json::parse(text));
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ContractViolation(std::string("Invalid JSON parameters: ") + e.what());
    }
}

} // namespace sqlgraph::cli
