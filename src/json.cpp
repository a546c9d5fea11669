#include <punctuation-cpp/json.hpp>
#include <punctuation-cpp/error.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace punctuation_cpp {

namespace {

auto decoding_error(std::string message) -> Exception {
    return Exception{ErrorKind::decoding_error, std::move(message)};
}

auto require_field(const nlohmann::json& j, const char* key, std::string_view owner)
    -> const nlohmann::json& {
    auto it = j.find(key);
    if (it == j.end()) {
        throw decoding_error(std::string{owner} + " is missing \"" + key + "\"");
    }
    return *it;
}

auto require_string(const nlohmann::json& j, std::string_view what) -> const std::string& {
    if (!j.is_string()) {
        throw decoding_error(std::string{what} + " must be a string");
    }
    return j.get_ref<const std::string&>();
}

}  // namespace

// =============================================================================
// Position
// =============================================================================

void to_json(nlohmann::json& j, Position position) {
    j = std::string{to_string_view(position)};
}

void from_json(const nlohmann::json& j, Position& position) {
    if (!j.is_string()) {
        throw Exception{ErrorKind::decoding_error, "mark position must be a string"};
    }
    const auto& name = j.get_ref<const std::string&>();
    auto parsed = position_from_string(name);
    if (!parsed) {
        throw Exception{ErrorKind::decoding_error, "unknown mark position: " + name};
    }
    position = *parsed;
}

// =============================================================================
// MarkRecord
// =============================================================================

void to_json(nlohmann::json& j, const MarkRecord& record) {
    j = nlohmann::json{
        {"line", record.line_index},
        {"text", record.text},
        {"position", record.position},
    };
}

void from_json(const nlohmann::json& j, MarkRecord& record) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::decoding_error, "mark record must be a JSON object"};
    }
    const auto& line = require_field(j, "line", "mark record");
    if (!line.is_number_integer() ||
        (!line.is_number_unsigned() && line.get<std::int64_t>() < 0)) {
        throw decoding_error("mark record \"line\" must be a non-negative integer");
    }
    record.line_index = line.get<std::size_t>();
    record.text = require_string(require_field(j, "text", "mark record"), "mark text");
    require_field(j, "position", "mark record").get_to(record.position);
}

// =============================================================================
// PreservedText
// =============================================================================

void to_json(nlohmann::json& j, const PreservedText& preserved) {
    j = nlohmann::json{
        {"chunks", preserved.chunks},
        {"marks", preserved.marks},
    };
}

void from_json(const nlohmann::json& j, PreservedText& preserved) {
    if (!j.is_object()) {
        throw Exception{ErrorKind::decoding_error, "preserved text must be a JSON object"};
    }
    const auto& chunks = require_field(j, "chunks", "preserved text");
    const auto& marks = require_field(j, "marks", "preserved text");
    if (!chunks.is_array() || !marks.is_array()) {
        throw decoding_error("preserved text \"chunks\" and \"marks\" must be arrays");
    }

    preserved.chunks.clear();
    preserved.chunks.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        preserved.chunks.push_back(require_string(chunk, "chunk"));
    }
    marks.get_to(preserved.marks);
}

// =============================================================================
// MarkUnit
// =============================================================================

void to_json(nlohmann::json& j, const MarkUnit& unit) {
    j = nlohmann::json{
        {"text", unit.text},
        {"begin", unit.begin},
        {"end", unit.end},
    };
}

}  // namespace punctuation_cpp
