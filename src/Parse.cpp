/**
 * @file Parse.cpp
 * @brief Implementation of string-to-Value parsing
 */

#include "strata/Parse.hpp"
#include "strata/Util.hpp"

#include <regex>

namespace strata {

namespace {

const std::regex& integer_pattern() {
    static const std::regex re("^-?[0-9]+$");
    return re;
}

const std::regex& float_pattern() {
    static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
    return re;
}

} // anonymous namespace

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (std::regex_match(str, integer_pattern())) {
        try {
            return static_cast<int64_t>(std::stoll(str));
        } catch (const std::out_of_range&) {
            // Too large for int64: keep the text.
            return str;
        }
    }

    if (std::regex_match(str, float_pattern())) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            return str;
        }
    }

    const bool compound = (str.front() == '{' && str.back() == '}') ||
                          (str.front() == '[' && str.back() == ']');
    const bool quoted = str.size() >= 2 && str.front() == '"' && str.back() == '"';
    if (compound || quoted) {
        Value parsed = Value::parse(str, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }

    return str;
}

} // namespace strata
