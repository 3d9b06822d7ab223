#include "reporter.hpp"
#include <algorithm>
#include <cctype>

namespace sqlgraph::reporting {

namespace {

std::string lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

std::string mask_connection_string(const std::string& connection_string) {
    std::string masked;
    size_t pos = 0;
    while (pos < connection_string.size()) {
        size_t end = connection_string.find(';', pos);
        if (end == std::string::npos) {
            end = connection_string.size();
        }
        std::string pair = connection_string.substr(pos, end - pos);

        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            std::string key = lower(trim(pair.substr(0, eq)));
            if (key == "pwd" || key == "password") {
                pair = pair.substr(0, eq + 1) + "***";
            }
        }

        masked += pair;
        if (end < connection_string.size()) {
            masked += ';';
        }
        pos = end + 1;
    }
    return masked;
}

} // namespace sqlgraph::reporting
