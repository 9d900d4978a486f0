/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "strata/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace strata {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c != '.') {
            current += c;
        } else if (!current.empty()) {
            segments.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }
    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {

// Non-negative integer without leading zeros ("0" itself is fine).
bool is_array_index(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

/**
 * @brief Resolve one segment below @p current
 * @return Child pointer, or nullptr when the segment does not exist
 * @throws TypeError when @p current is a scalar
 */
const Value* step(const Value& current, const std::string& seg, const std::string& path) {
    if (current.is_object()) {
        auto it = current.find(seg);
        return it == current.end() ? nullptr : &*it;
    }
    if (current.is_array()) {
        if (!is_array_index(seg)) return nullptr;
        size_t idx = std::stoull(seg);
        return idx < current.size() ? &current[idx] : nullptr;
    }
    throw TypeError(path, "object or array", type_name(current));
}

} // anonymous namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        const Value* next = step(*current, seg, path);
        if (next == nullptr) {
            throw KeyError(path, seg);
        }
        current = next;
    }
    return current;
}

const Value* get_by_dot(const Value& data, const std::string& path,
                        const Value& default_val) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        const Value* next = step(*current, seg, path);
        if (next == nullptr) {
            return &default_val;
        }
        current = next;
    }
    return current;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = step(*current, seg, path);
        if (current == nullptr) {
            return false;
        }
    }
    return true;
}

void set_by_dot(Value& data, const std::string& path,
                const Value& value, bool create_missing) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (!current->is_object()) {
            if (!create_missing) {
                throw TypeError(path, "object", type_name(*current));
            }
            *current = Value::object();
        }

        if (i + 1 == segments.size()) {
            (*current)[seg] = value;
            return;
        }

        if (!current->contains(seg)) {
            if (!create_missing) {
                throw KeyError(path, seg);
            }
            (*current)[seg] = Value::object();
        }
        current = &(*current)[seg];
    }
}

} // namespace strata
