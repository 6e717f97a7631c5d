/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameState.hpp"
#include "core/Logger.hpp"
#include "managers/CharacterLoader.hpp"
#include "managers/CharacterRecordSource.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/ResourcePath.hpp"
#include <format>
#include <iostream>
#include <string>

const std::string APP_NAME{"Trek Characters"};
const std::string SETTINGS_FILE{"res/settings.json"};

int main(int argc, char* argv[]) {
  TREKMAIN_INFO(std::format("Initializing {}", APP_NAME));

  TrekEngine::ResourcePath::init();

  auto& settingsManager = TrekEngine::SettingsManager::Instance();
  const std::string settingsPath =
      TrekEngine::ResourcePath::resolve(SETTINGS_FILE);
  if (!settingsManager.loadFromFile(settingsPath)) {
    TREKMAIN_WARN(std::format("Failed to load {} - using defaults",
                              settingsPath));
  } else {
    TREKMAIN_INFO(std::format("Settings loaded from {}", settingsPath));
  }

  const TrekEngine::CharacterSettings characterSettings =
      settingsManager.getCharacterSettings();

  // The command line wins over the configured directory
  const std::string charactersDir =
      (argc > 1) ? std::string(argv[1])
                 : TrekEngine::ResourcePath::resolve(characterSettings.directory);

  const TrekEngine::LoadPolicy policy = characterSettings.strictLoad
                                            ? TrekEngine::LoadPolicy::Strict
                                            : TrekEngine::LoadPolicy::Lenient;

  TrekEngine::CharacterDirectorySource source(charactersDir,
                                              characterSettings.extensions);
  TrekEngine::CharacterLoader loader;
  TrekEngine::GameState gameState;

  if (!gameState.initializeCharacters(source, loader, policy)) {
    TREKMAIN_CRITICAL(std::format("Character initialization failed for {}",
                                  charactersDir));
    std::cerr << "Character initialization failed.\n";
    for (const auto& line : gameState.getLogMessages()) {
      std::cerr << line << '\n';
    }
    for (const auto& error : gameState.getLoadingErrors()) {
      std::cerr << error << '\n';
    }
    return 1;
  }

  std::cout << std::format("Loaded {} characters\n",
                           gameState.getCharacterCount());

  if (const TrekEngine::Character* player = gameState.getPlayerCharacter()) {
    std::cout << std::format("Player: {}\n", player->getShortDescription());
    std::cout << player->getFamilyInfoDisplay() << '\n';
  }

  if (!gameState.getCharacterErrors().empty() ||
      !gameState.getCharacterWarnings().empty()) {
    std::cout << std::format("{} errors, {} warnings during load\n",
                             gameState.getCharacterErrors().size(),
                             gameState.getCharacterWarnings().size());
  }

  TREKMAIN_INFO(std::format("{} shutting down", APP_NAME));
  return 0;
}
