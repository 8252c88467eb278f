#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

namespace Lookalike {

// Shared formatting utilities for the PostgreSQL store.
// Batches travel as one text array parameter per column and are expanded
// server-side with unnest(), so a batch is one round trip.

// Format integers as a PostgreSQL array literal: {1,2,3}
template<typename Int>
inline std::string pg_int_array(const std::vector<Int>& values) {
    std::string out;
    out.reserve(values.size() * 8 + 2);
    out += '{';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ',';
        out += std::to_string(values[i]);
    }
    out += '}';
    return out;
}

// Format strings as a PostgreSQL array literal with every element quoted,
// so NULL, commas and braces inside values are taken literally.
inline std::string pg_text_array(const std::vector<std::string>& values) {
    std::string out;
    out += '{';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += ',';
        out += '"';
        for (char c : values[i]) {
            if (c == '"' || c == '\\') out += '\\';
            out += c;
        }
        out += '"';
    }
    out += '}';
    return out;
}

// Unquoted identifiers only: lowercase letter or underscore, then [a-z0-9_].
inline bool is_plain_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::islower(first) || first == '_')) return false;
    for (char ch : name) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (!(std::islower(c) || std::isdigit(c) || c == '_')) return false;
    }
    return true;
}

} // namespace Lookalike
