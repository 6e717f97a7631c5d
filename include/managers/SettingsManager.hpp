/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <boost/container/flat_map.hpp>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace TrekEngine {

/**
 * @brief Character loading options read from the "characters" category
 */
struct CharacterSettings {
  std::string directory{"res/data/characters"};
  // "extensions" setting, a comma separated list such as ".json,.chr"
  std::vector<std::string> extensions{".json"};
  bool strictLoad{false};
};

/**
 * @brief Thread-safe process configuration, grouped by category
 *
 * Settings are typed values (int, float, bool, string) persisted as a JSON
 * object of category objects. Categories and keys are kept sorted so that a
 * saved file is stable between runs.
 *
 * Usage:
 *   auto& settings = SettingsManager::Instance();
 *   settings.loadFromFile("res/settings.json");
 *   CharacterSettings chars = settings.getCharacterSettings();
 *   settings.set("characters", "strict_load", true);
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
   * @brief Callback for change notifications
   * @param category Category that changed
   * @param key Key that changed
   * @param newValue Value after the change
   */
  using ChangeCallback =
      std::function<void(const std::string& category, const std::string& key,
                         const SettingValue& newValue)>;

  /**
   * @brief Merges the settings of a JSON file into the current settings
   * @param filepath Path to the JSON settings file
   * @return false if the file is missing, malformed or not a JSON object
   */
  bool loadFromFile(const std::string& filepath);

  /**
   * @brief Writes every setting to a JSON file
   * @return false if the file cannot be opened for writing
   */
  bool saveToFile(const std::string& filepath) const;

  /**
   * @brief Gets a typed value, or defaultValue if absent or of another type
   */
  template <typename T>
  T get(const std::string& category, const std::string& key,
        T defaultValue = T{}) const;

  /**
   * @brief Stores a typed value and notifies matching listeners
   * @return false if T is not a supported setting type
   */
  template <typename T>
  bool set(const std::string& category, const std::string& key,
           const T& value);

  bool has(const std::string& category, const std::string& key) const;
  bool remove(const std::string& category, const std::string& key);
  bool clearCategory(const std::string& category);
  void clearAll();

  /**
   * @brief Registers a callback for setting changes
   * @param category Category to watch, empty watches every category
   * @return Id for unregisterChangeListener
   */
  size_t registerChangeListener(const std::string& category,
                                ChangeCallback callback);
  void unregisterChangeListener(size_t callbackId);

  std::vector<std::string> getCategories() const;
  std::vector<std::string> getKeys(const std::string& category) const;

  // Reads the "characters" category, falling back to defaults per key
  CharacterSettings getCharacterSettings() const;

private:
  using CategorySettings = boost::container::flat_map<std::string, SettingValue>;
  boost::container::flat_map<std::string, CategorySettings> m_settings;

  mutable std::shared_mutex m_settingsMutex;

  struct ListenerInfo {
    size_t id;
    std::string category;
    ChangeCallback callback;
  };
  std::vector<ListenerInfo> m_listeners;
  mutable std::mutex m_listenersMutex;
  size_t m_nextCallbackId{0};

  void notifyListeners(const std::string& category, const std::string& key,
                       const SettingValue& newValue);

  SettingsManager(const SettingsManager&) = delete;
  SettingsManager& operator=(const SettingsManager&) = delete;

  SettingsManager() = default;
};

template <typename T>
T SettingsManager::get(const std::string& category, const std::string& key,
                       T defaultValue) const {
  std::shared_lock<std::shared_mutex> lock(m_settingsMutex);

  auto categoryIt = m_settings.find(category);
  if (categoryIt == m_settings.end()) {
    return defaultValue;
  }

  auto keyIt = categoryIt->second.find(key);
  if (keyIt == categoryIt->second.end()) {
    return defaultValue;
  }

  if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
    if (const T* value = std::get_if<T>(&keyIt->second)) {
      return *value;
    }
  }
  return defaultValue;
}

template <typename T>
bool SettingsManager::set(const std::string& category, const std::string& key,
                          const T& value) {
  SettingValue settingValue;

  if constexpr (std::is_same_v<T, int> || std::is_same_v<T, float> ||
                std::is_same_v<T, bool> || std::is_same_v<T, std::string>) {
    settingValue = value;
  } else if constexpr (std::is_convertible_v<T, std::string>) {
    settingValue = std::string(value);
  } else {
    return false;
  }

  {
    std::unique_lock<std::shared_mutex> lock(m_settingsMutex);
    m_settings[category][key] = settingValue;
  }

  // Listeners run outside the settings lock so they may read settings
  notifyListeners(category, key, settingValue);
  return true;
}

} // namespace TrekEngine

#endif // SETTINGS_MANAGER_HPP
