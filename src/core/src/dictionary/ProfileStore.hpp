/**
 * @file ProfileStore.hpp
 * @brief Loads per-profile dictionaries and serves lookupEntries()
 */

#pragma once

#include "DictionaryTypes.hpp"
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gcode_annotator {
namespace dictionary {

/**
 * Profile Dictionary Store
 *
 * Directory layout:
 *   profiles/
 *     profiles.json               - ["Fanuc", "Haas"] (optional)
 *     Fanuc-annotations.json      - dictionary of profile "Fanuc"
 *     Haas-annotations.json
 *
 * Without profiles.json every *-annotations.json file is loaded.
 * Thread-safe; lookups return copies so callers never observe a reload.
 */
class ProfileStore {
public:
    ProfileStore() = default;
    ~ProfileStore() = default;

    /**
     * Load all profiles from a directory
     * @param dir Profiles directory
     * @return true if at least one profile was loaded
     */
    bool loadFromDirectory(const std::filesystem::path& dir);

    /**
     * Load (or replace) one profile from a dictionary file
     */
    bool loadProfileFile(const std::string& name, const std::filesystem::path& file);

    /**
     * Load (or replace) one profile from JSON text
     */
    bool loadProfileJson(const std::string& name, const std::string& text);

    /**
     * Register a profile directly
     */
    void setProfile(const std::string& name, ProfileDictionary entries);

    /**
     * Save one profile in entry array form
     */
    bool saveProfile(const std::string& name, const std::filesystem::path& file) const;

    /**
     * Ordered entries of a profile; empty when the profile is unknown
     */
    ProfileDictionary lookupEntries(const std::string& profileName) const;

    bool hasProfile(const std::string& name) const;

    /// Profile names in load order
    std::vector<std::string> profileNames() const;

    size_t profileCount() const;

    /// File name used for a profile's dictionary ("Fanuc-annotations.json")
    static std::string dictionaryFileName(const std::string& name);

private:
    std::optional<std::vector<std::string>> readProfileIndex(const std::filesystem::path& indexPath) const;
    void storeProfile(const std::string& name, ProfileDictionary entries);

    std::map<std::string, ProfileDictionary> m_profiles;
    std::vector<std::string> m_order;
    mutable std::mutex m_mutex;
};

} // namespace dictionary
} // namespace gcode_annotator
