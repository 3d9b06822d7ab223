#include "result_mapper.hpp"
#include <cctype>

namespace sqlgraph::data {

std::size_t compute_column_key(const std::vector<std::string>& columns) {
    std::size_t key = 17;
    for (const auto& column : columns) {
        key = key * 31 + std::hash<std::string>{}(column);
    }
    return key;
}

std::string normalize_column_name(std::string_view name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-' || c == ' ') {
            continue;
        }
        normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return normalized;
}

} // namespace sqlgraph::data
