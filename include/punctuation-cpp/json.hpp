/// @file json.hpp
/// @brief nlohmann/json interoperability for punctuation-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the values that
/// travel between preserve() and restore(), so preserved marks can be
/// stored or handed to another process while the chunks are processed.

#pragma once

#include <punctuation-cpp/mark_matcher.hpp>
#include <punctuation-cpp/mark_record.hpp>

#include <nlohmann/json.hpp>

namespace punctuation_cpp {

// -- Position -----------------------------------------------------------------

/// Serialized as "begin", "end", "middle" or "alone".
void to_json(nlohmann::json& j, Position position);

/// @throws Exception with ErrorKind::decoding_error on an unknown name.
void from_json(const nlohmann::json& j, Position& position);

// -- MarkRecord ---------------------------------------------------------------

/// Serialized as {"line": <index>, "text": <run>, "position": <name>}.
void to_json(nlohmann::json& j, const MarkRecord& record);

/// @throws Exception with ErrorKind::decoding_error on a missing field, a
/// wrong-typed field, or a negative line index.
void from_json(const nlohmann::json& j, MarkRecord& record);

// -- PreservedText ------------------------------------------------------------

/// Serialized as {"chunks": [...], "marks": [...]}.
void to_json(nlohmann::json& j, const PreservedText& preserved);

/// @throws Exception with ErrorKind::decoding_error on malformed input.
void from_json(const nlohmann::json& j, PreservedText& preserved);

// -- MarkUnit -----------------------------------------------------------------

/// Serialized as {"text": <run>, "begin": <offset>, "end": <offset>}.
/// Write-only: units are diagnostics, never fed back into the library.
void to_json(nlohmann::json& j, const MarkUnit& unit);

}  // namespace punctuation_cpp
