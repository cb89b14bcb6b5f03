#pragma once

/**
 * @file DictionaryJson.hpp
 * @brief JSON conversion for profile dictionaries
 *
 * Two document forms are accepted:
 *   - entry array:  [{"letter": "G", "value_or_range": "0", "description": "Rapid move",
 *                     "modal_group": "motion", "sub": [...]}]
 *   - annotation map: {"G00": "Rapid move", "G76": {"desc": "Threading", "sub": {"P": "..."}}}
 * The map form keeps its key order as declaration order.
 */

#include "DictionaryTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace gcode_annotator {
namespace dictionary {

using json = nlohmann::ordered_json;

void to_json(json& j, const ValuePattern& p);
void from_json(const json& j, ValuePattern& p);

void to_json(json& j, const DictionaryEntry& e);
void from_json(const json& j, DictionaryEntry& e);

/**
 * Build a dictionary from either document form.
 * Throws nlohmann::json::exception or std::invalid_argument on malformed input.
 */
ProfileDictionary dictionaryFromJson(const json& j);

/// Parse JSON text, see dictionaryFromJson
ProfileDictionary parseDictionary(const std::string& text);

/// Serialize to the entry array form
json dictionaryToJson(const ProfileDictionary& dictionary);

} // namespace dictionary
} // namespace gcode_annotator
