/**
 * @file DictionaryJson.cpp
 * @brief JSON conversion for profile dictionaries
 */

#include "DictionaryJson.hpp"
#include "../grammar/TokenGrammar.hpp"
#include "../logging/Logger.hpp"
#include <stdexcept>

namespace gcode_annotator {
namespace dictionary {

namespace {

/// "G00" -> {G, exact 0}, "X" -> {X, wildcard}, ",R" -> {",R", wildcard}
std::optional<DictionaryEntry> entryFromMapKey(const std::string& rawKey) {
    std::string key = normalizeKey(rawKey);
    bool comma = !key.empty() && key[0] == ',';
    std::string rest = key.substr(comma ? 1 : 0);
    if (rest.empty()) {
        return std::nullopt;
    }

    DictionaryEntry entry;
    if (rest.size() == 1) {
        if (!grammar::letterFromKey(rest)) return std::nullopt;
        entry.letter = key;
        entry.pattern = ValuePattern::wildcard();
        return entry;
    }

    auto letter = grammar::letterFromKey(rest.substr(0, 1));
    std::string value = rest.substr(1);
    if (!letter || !grammar::isNumericLiteral(value)) {
        return std::nullopt;
    }

    entry.letter = key.substr(0, comma ? 2 : 1);
    try {
        entry.pattern = ValuePattern::exact(std::stod(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Value out of range in dictionary key '" + rawKey + "'");
    }
    return entry;
}

ProfileDictionary dictionaryFromMap(const json& j) {
    ProfileDictionary dictionary;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& key = it.key();
        const json& value = it.value();

        auto entry = entryFromMapKey(key);
        if (!entry) {
            LOG_WARN("Skipping dictionary key '{}': not a G-code word", key);
            continue;
        }

        if (value.is_string()) {
            entry->description = value.get<std::string>();
        } else if (value.is_object()) {
            entry->description = value.value("desc", "");
            if (value.contains("sub") && value["sub"].is_object()) {
                entry->sub = dictionaryFromMap(value["sub"]);
            }
        } else {
            LOG_WARN("Skipping dictionary key '{}': unsupported value type", key);
            continue;
        }
        dictionary.push_back(std::move(*entry));
    }
    return dictionary;
}

} // namespace

void to_json(json& j, const ValuePattern& p) {
    if (p.kind == ValuePattern::Kind::EXACT) {
        j = p.low;
    } else {
        j = p.toString();
    }
}

void from_json(const json& j, ValuePattern& p) {
    if (j.is_null()) {
        p = ValuePattern::wildcard();
        return;
    }
    if (j.is_number()) {
        p = ValuePattern::exact(j.get<double>());
        return;
    }

    std::string text = j.get<std::string>();
    auto parsed = ValuePattern::parse(text);
    if (!parsed) {
        throw std::invalid_argument("Invalid value_or_range: '" + text + "'");
    }
    p = *parsed;
}

void to_json(json& j, const DictionaryEntry& e) {
    j = json{
        {"letter", e.letter},
        {"value_or_range", e.pattern},
        {"description", e.description}
    };
    if (e.modalGroup) {
        j["modal_group"] = modal::modalGroupToString(*e.modalGroup);
    }
    if (!e.sub.empty()) {
        j["sub"] = e.sub;
    }
}

void from_json(const json& j, DictionaryEntry& e) {
    e.letter = normalizeKey(j.at("letter").get<std::string>());
    j.at("description").get_to(e.description);

    if (j.contains("value_or_range")) {
        j.at("value_or_range").get_to(e.pattern);
    } else {
        e.pattern = ValuePattern::wildcard();
    }

    e.modalGroup.reset();
    if (j.contains("modal_group") && !j["modal_group"].is_null()) {
        std::string name = j["modal_group"].get<std::string>();
        e.modalGroup = modal::modalGroupFromString(name);
        if (!e.modalGroup) {
            throw std::invalid_argument("Unknown modal_group: '" + name + "'");
        }
    }

    e.sub.clear();
    if (j.contains("sub")) {
        j.at("sub").get_to(e.sub);
    }
}

ProfileDictionary dictionaryFromJson(const json& j) {
    if (j.is_array()) {
        return j.get<ProfileDictionary>();
    }
    if (j.is_object()) {
        return dictionaryFromMap(j);
    }
    throw std::invalid_argument("Dictionary must be a JSON array or object");
}

ProfileDictionary parseDictionary(const std::string& text) {
    return dictionaryFromJson(json::parse(text));
}

json dictionaryToJson(const ProfileDictionary& dictionary) {
    return json(dictionary);
}

} // namespace dictionary
} // namespace gcode_annotator
