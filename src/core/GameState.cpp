/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameState.hpp"
#include "core/Logger.hpp"
#include <format>

namespace TrekEngine {

bool GameState::initializeCharacters(LoadResult &&result, LoadPolicy policy) {
  m_characterLoadComplete = false;

  for (const auto &line : result.log) {
    addLog(line);
  }

  m_characters = std::move(result.registry);
  m_playerCharacterId = std::move(result.playerId);
  m_characterErrors = std::move(result.errors);
  m_characterWarnings = std::move(result.warnings);

  if (m_characters.empty()) {
    addLog("GameState: Character initialization complete, but no characters "
           "were loaded.");
  }

  if (!m_characters.empty() && !m_playerCharacterId) {
    addLog("GameState: CRITICAL - Characters loaded, but no player character "
           "designated.");
    m_loadingErrors.push_back(
        "GameState: No player character designated after character load.");
    GAMESTATE_CRITICAL("No player character designated after character load");
    return false;
  }

  if (policy == LoadPolicy::Strict && !m_characterErrors.empty()) {
    addLog(std::format("GameState: Character initialization completed with "
                       "{} issues (strict load).",
                       m_characterErrors.size()));
    m_loadingErrors.push_back(
        std::format("GameState: Character load reported {} errors.",
                    m_characterErrors.size()));
    GAMESTATE_ERROR(std::format("Strict character load failed with {} errors",
                                m_characterErrors.size()));
    return false;
  }

  if (!m_characterErrors.empty()) {
    addLog(std::format("GameState: Character initialization completed with "
                       "{} non-fatal issues.",
                       m_characterErrors.size()));
    GAMESTATE_WARN(std::format("Continuing with {} character load issues",
                               m_characterErrors.size()));
  }

  m_characterLoadComplete = true;
  GAMESTATE_INFO(std::format("Character initialization complete: {} characters",
                             m_characters.size()));
  return true;
}

bool GameState::initializeCharacters(CharacterRecordSource &source,
                                     CharacterLoader &loader,
                                     LoadPolicy policy) {
  std::optional<LoadResult> result = loader.loadFromSource(source);
  if (!result) {
    m_characterLoadComplete = false;
    addLog(std::format("GameState: Critical failure during character load, "
                       "source not available: {}",
                       source.describe()));
    m_loadingErrors.push_back(std::format(
        "Characters directory not found: {}", source.describe()));
    GAMESTATE_CRITICAL(std::format("Character source not available: {}",
                                   source.describe()));
    return false;
  }

  return initializeCharacters(std::move(*result), policy);
}

const Character *GameState::getCharacter(const std::string &id) const {
  return m_characters.find(id);
}

std::vector<const Character *> GameState::getAllCharacters() const {
  std::vector<const Character *> characters;
  characters.reserve(m_characters.size());
  for (const Character &character : m_characters) {
    characters.push_back(&character);
  }
  return characters;
}

const Character *GameState::getPlayerCharacter() const {
  if (!m_playerCharacterId) {
    return nullptr;
  }
  return getCharacter(*m_playerCharacterId);
}

void GameState::addLog(const std::string &message) {
  m_logMessages.push_back(message);
}

} // namespace TrekEngine
