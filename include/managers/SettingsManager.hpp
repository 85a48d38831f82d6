/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace TinselEngine {

/**
 * @brief Category/key store for the tunables in res/settings.json
 *
 * Layout:
 * {
 *   "graphics": { "resolution_width": 1280, "vsync": true },
 *   "tree":     { "height": 30.0, "base_radius": 14.0 },
 *   ...
 * }
 *
 * Lookups never fail: a missing category, a missing key or a type mismatch
 * all return the caller's default. Integral JSON numbers are stored as int,
 * and get<float> accepts them so "height": 30 reads as 30.0f.
 *
 * Only touched from the main thread.
 */
class SettingsManager {
public:
    ~SettingsManager() = default;

    static SettingsManager& Instance() {
        static SettingsManager instance;
        return instance;
    }

    using SettingValue = std::variant<int, float, bool, std::string>;

    /**
     * @brief Merge settings from a JSON file into the store
     * @return false if the file is missing, malformed, or its root isn't an object
     */
    bool loadFromFile(const std::string& filepath);

    template<typename T>
    T get(const std::string& category, const std::string& key, T defaultValue = T{}) const;

    template<typename T>
    bool set(const std::string& category, const std::string& key, const T& value);

    bool has(const std::string& category, const std::string& key) const;

    void clearAll();

    std::vector<std::string> getCategories() const;
    std::vector<std::string> getKeys(const std::string& category) const;

private:
    using CategorySettings = std::unordered_map<std::string, SettingValue>;
    std::unordered_map<std::string, CategorySettings> m_settings;

    const SettingValue* find(const std::string& category, const std::string& key) const;

    SettingsManager(const SettingsManager&) = delete;
    SettingsManager& operator=(const SettingsManager&) = delete;

    SettingsManager() = default;
};

template<typename T>
T SettingsManager::get(const std::string& category, const std::string& key, T defaultValue) const {
    const SettingValue* value = find(category, key);
    if (value == nullptr) {
        return defaultValue;
    }

    if constexpr (std::is_same_v<T, float>) {
        if (const int* asInt = std::get_if<int>(value)) {
            return static_cast<float>(*asInt);
        }
    }

    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        if (const T* typed = std::get_if<T>(value)) {
            return *typed;
        }
    }

    // Type mismatch or unsupported type
    return defaultValue;
}

template<typename T>
bool SettingsManager::set(const std::string& category, const std::string& key, const T& value) {
    if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                  std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
        m_settings[category][key] = value;
        return true;
    } else if constexpr (std::is_convertible_v<T, std::string>) {
        m_settings[category][key] = std::string(value);
        return true;
    } else {
        return false;
    }
}

} // namespace TinselEngine

#endif // SETTINGS_MANAGER_HPP
