/**
 * @file ModalTypes.cpp
 * @brief Modal group names and value descriptions
 */

#include "ModalTypes.hpp"
#include "../grammar/TokenGrammar.hpp"
#include <map>

namespace gcode_annotator {
namespace modal {

namespace {

struct GroupNames {
    ModalGroup group;
    const char* id;
    const char* label;
};

constexpr GroupNames kGroupNames[kModalGroupCount] = {
    {ModalGroup::MOTION, "motion", "motion mode"},
    {ModalGroup::PLANE, "plane", "plane selection"},
    {ModalGroup::POSITIONING, "positioning", "positioning mode"},
    {ModalGroup::UNITS, "units", "units"},
    {ModalGroup::FEED_MODE, "feed_mode", "feed mode"},
    {ModalGroup::COORDINATE_SYSTEM, "coordinate_system", "coordinate system"},
    {ModalGroup::SPINDLE, "spindle", "spindle state"},
    {ModalGroup::COOLANT, "coolant", "coolant"},
    {ModalGroup::TOOL, "tool", "tool"},
    {ModalGroup::SPINDLE_SPEED, "spindle_speed", "spindle speed"},
    {ModalGroup::FEED_RATE, "feed_rate", "feed rate"},
};

// Fixed readings of the G/M codes that set a modal group
const std::map<std::string, std::string>& codeTexts() {
    static const std::map<std::string, std::string> texts = {
        {"G0", "rapid motion"},
        {"G1", "linear motion"},
        {"G2", "clockwise arc"},
        {"G3", "counter-clockwise arc"},
        {"G80", "canned cycle cancelled"},
        {"G17", "XY plane"},
        {"G18", "ZX plane"},
        {"G19", "YZ plane"},
        {"G90", "absolute positioning"},
        {"G91", "incremental positioning"},
        {"G20", "inch units"},
        {"G21", "millimetre units"},
        {"G93", "inverse time feed"},
        {"G94", "units per minute feed"},
        {"G95", "units per revolution feed"},
        {"M3", "spindle clockwise"},
        {"M4", "spindle counter-clockwise"},
        {"M5", "spindle stopped"},
        {"M7", "mist coolant"},
        {"M8", "flood coolant"},
        {"M9", "coolant off"},
    };
    return texts;
}

} // namespace

std::string modalGroupToString(ModalGroup group) {
    return kGroupNames[static_cast<size_t>(group)].id;
}

std::optional<ModalGroup> modalGroupFromString(const std::string& name) {
    for (const auto& entry : kGroupNames) {
        if (name == entry.id) {
            return entry.group;
        }
    }
    return std::nullopt;
}

std::string modalGroupLabel(ModalGroup group) {
    return kGroupNames[static_cast<size_t>(group)].label;
}

std::string describeModalValue(ModalGroup group, const std::optional<ModalValue>& value) {
    if (!value) {
        return "undefined " + modalGroupLabel(group);
    }

    switch (group) {
        case ModalGroup::TOOL:
            return "tool " + grammar::formatValue(value->value);
        case ModalGroup::SPINDLE_SPEED:
            return "spindle speed " + grammar::formatValue(value->value);
        case ModalGroup::FEED_RATE:
            return "feed rate " + grammar::formatValue(value->value);
        case ModalGroup::COORDINATE_SYSTEM:
            return "work offset " + value->code;
        default:
            break;
    }

    auto it = codeTexts().find(value->code);
    if (it != codeTexts().end()) {
        return it->second;
    }
    if (group == ModalGroup::MOTION && value->value >= 73 && value->value <= 89) {
        return "canned cycle " + value->code;
    }
    return value->code;
}

} // namespace modal
} // namespace gcode_annotator
