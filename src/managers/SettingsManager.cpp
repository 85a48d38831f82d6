/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace TinselEngine {

bool SettingsManager::loadFromFile(const std::string& filepath) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    const JsonValue& root = reader.getRoot();
    const JsonObject* rootObj = root.tryAsObject();
    if (rootObj == nullptr) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    size_t loaded = 0;
    for (const auto& [categoryName, categoryValue] : *rootObj) {
        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (categoryObj == nullptr) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            SettingValue settingValue;

            if (value.isBool()) {
                settingValue = value.asBool();
            } else if (value.isNumber()) {
                double numValue = value.asNumber();
                bool integral = std::floor(numValue) == numValue &&
                                std::fabs(numValue) <= std::numeric_limits<int>::max();
                if (integral) {
                    settingValue = static_cast<int>(numValue);
                } else {
                    settingValue = static_cast<float>(numValue);
                }
            } else if (value.isString()) {
                settingValue = value.asString();
            } else {
                SETTINGS_WARNING("Unsupported value type for setting '" + categoryName + "." + key + "', skipping");
                continue;
            }

            m_settings[categoryName][key] = std::move(settingValue);
            ++loaded;
        }
    }

    SETTINGS_INFO(std::format("Loaded {} settings from file: {}", loaded, filepath));
    return true;
}

const SettingsManager::SettingValue* SettingsManager::find(const std::string& category,
                                                           const std::string& key) const {
    auto categoryIt = m_settings.find(category);
    if (categoryIt == m_settings.end()) {
        return nullptr;
    }

    auto keyIt = categoryIt->second.find(key);
    if (keyIt == categoryIt->second.end()) {
        return nullptr;
    }
    return &keyIt->second;
}

bool SettingsManager::has(const std::string& category, const std::string& key) const {
    return find(category, key) != nullptr;
}

void SettingsManager::clearAll() {
    m_settings.clear();
}

std::vector<std::string> SettingsManager::getCategories() const {
    std::vector<std::string> categories;
    categories.reserve(m_settings.size());
    for (const auto& [category, settings] : m_settings) {
        categories.push_back(category);
    }
    std::sort(categories.begin(), categories.end());
    return categories;
}

std::vector<std::string> SettingsManager::getKeys(const std::string& category) const {
    std::vector<std::string> keys;
    auto categoryIt = m_settings.find(category);
    if (categoryIt != m_settings.end()) {
        keys.reserve(categoryIt->second.size());
        for (const auto& [key, value] : categoryIt->second) {
            keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());
    }
    return keys;
}

} // namespace TinselEngine
