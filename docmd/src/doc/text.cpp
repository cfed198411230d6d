//! # Text Helpers Implementation

#include "doc/text.hpp"

#include <algorithm>

namespace docmd::doc {

auto trim(std::string_view s) -> std::string {
    size_t start = 0;
    while (start < s.size() && is_space(s[start])) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && is_space(s[end - 1])) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

auto is_blank(std::string_view s) -> bool {
    return std::all_of(s.begin(), s.end(), [](char c) { return is_space(c); });
}

auto to_lower(std::string_view s) -> std::string {
    std::string lower(s);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return lower;
}

} // namespace docmd::doc
