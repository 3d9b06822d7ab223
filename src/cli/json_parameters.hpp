#pragma once

#include "data/parameter_binder.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sqlgraph::cli {

// JSON scalar -> SqlValue. Integers that fit 32 bits become Int32, wider
// ones Int64; strings stay text. Arrays and objects are rejected with
// core::ContractViolation.
data::SqlValue value_from_json(const nlohmann::ordered_json& value);

// JSON object -> ParameterBag in document key order (column lists follow
// it). A JSON null document is a null bag.
std::optional<data::ParameterBag> bag_from_json(const nlohmann::ordered_json& document);

// Parses `text` as a JSON object; an empty string is a null bag
std::optional<data::ParameterBag> parse_bag(const std::string& text);

} // namespace sqlgraph::cli
