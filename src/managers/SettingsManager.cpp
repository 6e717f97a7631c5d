/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SettingsManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <limits>

namespace TrekEngine {

namespace {

std::string toJsonText(const SettingsManager::SettingValue& value) {
  return std::visit(
      [](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, bool>) {
          return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int>) {
          return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, float>) {
          return std::format("{}", arg);
        } else {
          return JsonValue(arg).toString();
        }
      },
      value);
}

// Splits "a, b,,c" into {"a", "b", "c"}
std::vector<std::string> splitList(const std::string& text) {
  std::vector<std::string> items;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(',', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    const size_t first = text.find_first_not_of(" \t", start);
    if (first != std::string::npos && first < end) {
      const size_t last = text.find_last_not_of(" \t", end - 1);
      items.push_back(text.substr(first, last - first + 1));
    }
    start = end + 1;
  }
  return items;
}

} // namespace

bool SettingsManager::loadFromFile(const std::string& filepath) {
  JsonReader reader;
  if (!reader.loadFromFile(filepath)) {
    SETTINGS_ERROR(std::format("Failed to load settings from file: {} - {}",
                               filepath, reader.getLastError()));
    return false;
  }

  const JsonValue& root = reader.getRoot();
  if (!root.isObject()) {
    SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
    return false;
  }

  std::vector<std::pair<std::string, std::pair<std::string, SettingValue>>>
      loaded;

  for (const auto& [categoryName, categoryValue] : root.asObject()) {
    if (!categoryValue.isObject()) {
      SETTINGS_WARNING("Category '" + categoryName +
                       "' is not an object, skipping");
      continue;
    }

    for (const auto& [key, value] : categoryValue.asObject()) {
      SettingValue settingValue;
      if (value.isBool()) {
        settingValue = value.asBool();
      } else if (value.isInteger() &&
                 value.asNumber() >= std::numeric_limits<int>::min() &&
                 value.asNumber() <= std::numeric_limits<int>::max()) {
        settingValue = value.asInt();
      } else if (value.isNumber()) {
        settingValue = static_cast<float>(value.asNumber());
      } else if (value.isString()) {
        settingValue = value.asString();
      } else {
        SETTINGS_WARNING(std::format(
            "Unsupported value type for setting '{}.{}', skipping",
            categoryName, key));
        continue;
      }
      loaded.emplace_back(categoryName,
                          std::make_pair(key, std::move(settingValue)));
    }
  }

  {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    for (const auto& [category, entry] : loaded) {
      m_settings[category][entry.first] = entry.second;
    }
  }

  for (const auto& [category, entry] : loaded) {
    notifyListeners(category, entry.first, entry.second);
  }

  SETTINGS_INFO(std::format("Loaded {} settings from file: {}", loaded.size(),
                            filepath));
  return true;
}

bool SettingsManager::saveToFile(const std::string& filepath) const {
  std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

  std::ofstream file(filepath);
  if (!file.is_open()) {
    SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
    return false;
  }

  file << "{\n";
  size_t categoryIndex = 0;
  for (const auto& [categoryName, categorySettings] : m_settings) {
    file << "  " << JsonValue(categoryName).toString() << ": {\n";

    size_t keyIndex = 0;
    for (const auto& [key, value] : categorySettings) {
      file << "    " << JsonValue(key).toString() << ": " << toJsonText(value);
      if (++keyIndex < categorySettings.size()) {
        file << ",";
      }
      file << "\n";
    }

    file << "  }";
    if (++categoryIndex < m_settings.size()) {
      file << ",";
    }
    file << "\n";
  }
  file << "}\n";

  if (!file) {
    SETTINGS_ERROR("Failed while writing settings file: " + filepath);
    return false;
  }

  SETTINGS_INFO("Saved settings to file: " + filepath);
  return true;
}

bool SettingsManager::has(const std::string& category,
                          const std::string& key) const {
  std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

  auto categoryIt = m_settings.find(category);
  return categoryIt != m_settings.end() &&
         categoryIt->second.find(key) != categoryIt->second.end();
}

bool SettingsManager::remove(const std::string& category,
                             const std::string& key) {
  std::unique_lock<std::shared_mutex> lock(m_settingsMutex);

  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end() || categoryIt->second.erase(key) == 0) {
    return false;
  }

  if (categoryIt->second.empty()) {
    m_settings.erase(categoryIt);
  }
  return true;
}

bool SettingsManager::clearCategory(const std::string& category) {
  std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
  return m_settings.erase(category) > 0;
}

void SettingsManager::clearAll() {
  std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
  m_settings.clear();
}

size_t SettingsManager::registerChangeListener(const std::string& category,
                                               ChangeCallback callback) {
  std::lock_guard<std::mutex> lock(m_listenersMutex);

  size_t id = m_nextCallbackId++;
  m_listeners.push_back({id, category, std::move(callback)});
  return id;
}

void SettingsManager::unregisterChangeListener(size_t callbackId) {
  std::lock_guard<std::mutex> lock(m_listenersMutex);

  m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(),
                                   [callbackId](const ListenerInfo& info) {
                                     return info.id == callbackId;
                                   }),
                    m_listeners.end());
}

std::vector<std::string> SettingsManager::getCategories() const {
  std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

  std::vector<std::string> categories;
  categories.reserve(m_settings.size());
  for (const auto& [category, _] : m_settings) {
    categories.push_back(category);
  }
  return categories;
}

std::vector<std::string>
SettingsManager::getKeys(const std::string& category) const {
  std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end()) {
    return {};
  }

  std::vector<std::string> keys;
  keys.reserve(categoryIt->second.size());
  for (const auto& [key, _] : categoryIt->second) {
    keys.push_back(key);
  }
  return keys;
}

CharacterSettings SettingsManager::getCharacterSettings() const {
  CharacterSettings defaults;
  CharacterSettings settings;
  settings.directory =
      get<std::string>("characters", "directory", defaults.directory);
  std::vector<std::string> extensions =
      splitList(get<std::string>("characters", "extensions", ""));
  settings.extensions =
      extensions.empty() ? defaults.extensions : std::move(extensions);
  settings.strictLoad = get<bool>("characters", "strict_load", defaults.strictLoad);
  return settings;
}

void SettingsManager::notifyListeners(const std::string& category,
                                      const std::string& key,
                                      const SettingValue& newValue) {
  std::lock_guard<std::mutex> lock(m_listenersMutex);

  for (const auto& listener : m_listeners) {
    if (listener.category.empty() || listener.category == category) {
      listener.callback(category, key, newValue);
    }
  }
}

} // namespace TrekEngine
