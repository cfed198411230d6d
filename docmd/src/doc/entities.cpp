//! # Entity Decoder Implementation

#include "doc/entities.hpp"

namespace docmd::doc {

auto decode_entity(std::string_view name) -> std::string {
    if (name == "lt") {
        return "<";
    }
    if (name == "gt") {
        return ">";
    }
    if (name == "amp") {
        return "&";
    }
    if (name == "nbsp") {
        return " ";
    }
    if (name == "quot") {
        return "\"";
    }

    std::string raw;
    raw.reserve(name.size() + 2);
    raw += '&';
    raw += name;
    raw += ';';
    return raw;
}

} // namespace docmd::doc
