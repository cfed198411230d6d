//! # Entity Decoder
//!
//! Maps the named character references that show up in documentation
//! comments to their literal characters.

#ifndef DOCMD_DOC_ENTITIES_HPP
#define DOCMD_DOC_ENTITIES_HPP

#include <string>
#include <string_view>

namespace docmd::doc {

/// Decodes a named character reference given without `&` and `;`.
///
/// Recognizes `lt`, `gt`, `amp`, `nbsp` (decoded to a plain space) and
/// `quot`. Any other name is returned as `&name;` unchanged.
///
/// @param name The entity name, e.g. `"amp"`.
/// @returns The decoded text.
[[nodiscard]] auto decode_entity(std::string_view name) -> std::string;

} // namespace docmd::doc

#endif // DOCMD_DOC_ENTITIES_HPP
