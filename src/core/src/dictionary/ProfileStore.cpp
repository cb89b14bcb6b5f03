/**
 * @file ProfileStore.cpp
 * @brief Profile Dictionary Store implementation
 */

#include "ProfileStore.hpp"
#include "DictionaryJson.hpp"
#include "../logging/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace gcode_annotator {
namespace dictionary {

namespace fs = std::filesystem;

namespace {

const std::string kIndexFile = "profiles.json";
const std::string kDictionarySuffix = "-annotations.json";

} // namespace

std::string ProfileStore::dictionaryFileName(const std::string& name) {
    return name + kDictionarySuffix;
}

bool ProfileStore::loadFromDirectory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOG_ERROR("Profiles directory does not exist: {}", dir.string());
        return false;
    }

    std::vector<std::string> names;
    auto indexPath = dir / kIndexFile;
    if (fs::exists(indexPath, ec)) {
        auto index = readProfileIndex(indexPath);
        if (!index) {
            return false;
        }
        names = std::move(*index);
    } else {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            std::string file = entry.path().filename().string();
            if (file.size() > kDictionarySuffix.size() &&
                file.compare(file.size() - kDictionarySuffix.size(), kDictionarySuffix.size(),
                             kDictionarySuffix) == 0) {
                names.push_back(file.substr(0, file.size() - kDictionarySuffix.size()));
            }
        }
        std::sort(names.begin(), names.end());
    }

    size_t loaded = 0;
    for (const auto& name : names) {
        auto file = dir / dictionaryFileName(name);
        if (!fs::exists(file, ec)) {
            // A profile without a dictionary file annotates every word as unknown
            LOG_WARN("No dictionary file for profile '{}', using empty dictionary", name);
            setProfile(name, {});
            ++loaded;
            continue;
        }
        if (loadProfileFile(name, file)) {
            ++loaded;
        } else {
            LOG_WARN("Failed to load profile: {}", name);
        }
    }

    LOG_INFO("Profile store loaded {} of {} profiles from {}", loaded, names.size(), dir.string());
    return loaded > 0;
}

std::optional<std::vector<std::string>> ProfileStore::readProfileIndex(const fs::path& indexPath) const {
    try {
        std::ifstream file(indexPath);
        if (!file.is_open()) {
            LOG_ERROR("Cannot open profile index: {}", indexPath.string());
            return std::nullopt;
        }

        json root = json::parse(file);
        if (!root.is_array()) {
            LOG_ERROR("Profile index must be an array of names: {}", indexPath.string());
            return std::nullopt;
        }
        return root.get<std::vector<std::string>>();

    } catch (const json::exception& e) {
        LOG_ERROR("JSON error in profile index {}: {}", indexPath.string(), e.what());
        return std::nullopt;
    }
}

bool ProfileStore::loadProfileFile(const std::string& name, const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open dictionary file: {}", file.string());
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    if (!loadProfileJson(name, buffer.str())) {
        LOG_ERROR("Dictionary file rejected: {}", file.string());
        return false;
    }
    return true;
}

bool ProfileStore::loadProfileJson(const std::string& name, const std::string& text) {
    if (name.empty()) {
        LOG_ERROR("Cannot load profile with empty name");
        return false;
    }

    try {
        ProfileDictionary entries = parseDictionary(text);
        LOG_DEBUG("Profile '{}': {} dictionary entries", name, entries.size());
        setProfile(name, std::move(entries));
        return true;

    } catch (const json::exception& e) {
        LOG_ERROR("JSON error in profile '{}': {}", name, e.what());
        return false;
    } catch (const std::exception& e) {
        LOG_ERROR("Error loading profile '{}': {}", name, e.what());
        return false;
    }
}

void ProfileStore::setProfile(const std::string& name, ProfileDictionary entries) {
    std::lock_guard<std::mutex> lock(m_mutex);
    storeProfile(name, std::move(entries));
}

void ProfileStore::storeProfile(const std::string& name, ProfileDictionary entries) {
    if (m_profiles.find(name) == m_profiles.end()) {
        m_order.push_back(name);
    }
    m_profiles[name] = std::move(entries);
}

bool ProfileStore::saveProfile(const std::string& name, const fs::path& file) const {
    json document;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_profiles.find(name);
        if (it == m_profiles.end()) {
            LOG_ERROR("Cannot save unknown profile: {}", name);
            return false;
        }
        document = dictionaryToJson(it->second);
    }

    try {
        if (file.has_parent_path()) {
            fs::create_directories(file.parent_path());
        }
        std::ofstream out(file);
        if (!out.is_open()) {
            LOG_ERROR("Cannot write dictionary file: {}", file.string());
            return false;
        }
        out << document.dump(2);
        LOG_INFO("Saved profile '{}' to {}", name, file.string());
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Error saving profile '{}': {}", name, e.what());
        return false;
    }
}

ProfileDictionary ProfileStore::lookupEntries(const std::string& profileName) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_profiles.find(profileName);
    if (it == m_profiles.end()) {
        return {};
    }
    return it->second;
}

bool ProfileStore::hasProfile(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profiles.find(name) != m_profiles.end();
}

std::vector<std::string> ProfileStore::profileNames() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_order;
}

size_t ProfileStore::profileCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_profiles.size();
}

} // namespace dictionary
} // namespace gcode_annotator
