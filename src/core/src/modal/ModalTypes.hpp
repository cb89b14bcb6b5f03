#pragma once

/**
 * @file ModalTypes.hpp
 * @brief Modal groups and the per-document modal context
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace gcode_annotator {
namespace modal {

/**
 * Modal groups tracked across lines
 */
enum class ModalGroup : uint8_t {
    MOTION = 0,         // G0-G3 G73 G74 G76 G80-G89
    PLANE,              // G17 G18 G19
    POSITIONING,        // G90 G91
    UNITS,              // G20 G21
    FEED_MODE,          // G93 G94 G95
    COORDINATE_SYSTEM,  // G54-G59
    SPINDLE,            // M3 M4 M5
    COOLANT,            // M7 M8 M9
    TOOL,               // T
    SPINDLE_SPEED,      // S
    FEED_RATE           // F
};

constexpr size_t kModalGroupCount = 11;

/**
 * Value a modal group was last set to
 */
struct ModalValue {
    std::string code;   // "G90", "T3", "S12000"
    double value = 0.0;

    bool operator==(const ModalValue& other) const {
        return code == other.code && value == other.value;
    }
    bool operator!=(const ModalValue& other) const { return !(*this == other); }
};

/**
 * Modal context of one document. Every group starts unset ("undefined")
 * and is overwritten as lines are applied top to bottom.
 */
class ModalContext {
public:
    ModalContext() = default;

    const std::optional<ModalValue>& get(ModalGroup group) const {
        return m_values[static_cast<size_t>(group)];
    }

    bool isSet(ModalGroup group) const { return get(group).has_value(); }

    void set(ModalGroup group, ModalValue value) {
        m_values[static_cast<size_t>(group)] = std::move(value);
    }

    /// Back to all-undefined (document reloaded or cleared)
    void reset() { m_values = {}; }

    bool operator==(const ModalContext& other) const { return m_values == other.m_values; }
    bool operator!=(const ModalContext& other) const { return !(*this == other); }

private:
    std::array<std::optional<ModalValue>, kModalGroupCount> m_values{};
};

/// Identifier used in dictionary files and templates ("positioning", "feed_mode")
std::string modalGroupToString(ModalGroup group);
std::optional<ModalGroup> modalGroupFromString(const std::string& name);

/// Human label ("positioning mode", "plane selection")
std::string modalGroupLabel(ModalGroup group);

/**
 * Readable text for a group's current value, e.g. "absolute positioning",
 * "tool 3", or "undefined positioning mode" when unset.
 */
std::string describeModalValue(ModalGroup group, const std::optional<ModalValue>& value);

} // namespace modal
} // namespace gcode_annotator
