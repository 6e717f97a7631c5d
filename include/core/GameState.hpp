/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_STATE_HPP
#define GAME_STATE_HPP

#include "managers/CharacterLoader.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace TrekEngine {

/**
 * @brief How GameState judges a character load that reported problems
 */
enum class LoadPolicy : uint8_t {
  Lenient = 0, // Only a populated registry without a player is fatal
  Strict = 1   // Any classified loader error is fatal
};

/**
 * @brief Session-level owner of the loaded characters
 *
 * Owns the registry handed over by the loader and answers character queries
 * for whatever runs on top of it. There is one GameState per session, passed
 * explicitly to the code that needs it.
 */
class GameState {
public:
  GameState() = default;
  ~GameState() = default;

  GameState(const GameState &) = delete;
  GameState &operator=(const GameState &) = delete;
  GameState(GameState &&) = default;
  GameState &operator=(GameState &&) = default;

  /**
   * @brief Adopts a finished load and judges it under the given policy
   * @param result Loader output, moved into the session
   * @param policy Lenient or Strict handling of loader errors
   * @return true if the session can start with these characters
   */
  bool initializeCharacters(LoadResult &&result,
                            LoadPolicy policy = LoadPolicy::Lenient);

  /**
   * @brief Runs the loader over a record source, then adopts the result
   * @return false if the source could not be consulted or the policy fails
   */
  bool initializeCharacters(CharacterRecordSource &source,
                            CharacterLoader &loader,
                            LoadPolicy policy = LoadPolicy::Lenient);

  const Character *getCharacter(const std::string &id) const;
  std::vector<const Character *> getAllCharacters() const;
  const Character *getPlayerCharacter() const;
  const std::optional<std::string> &getPlayerCharacterId() const {
    return m_playerCharacterId;
  }
  size_t getCharacterCount() const { return m_characters.size(); }
  const CharacterRegistry &getCharacters() const { return m_characters; }

  bool isCharacterLoadComplete() const { return m_characterLoadComplete; }

  // Issues reported by the last character load
  const std::vector<LoadIssue> &getCharacterErrors() const {
    return m_characterErrors;
  }
  const std::vector<LoadIssue> &getCharacterWarnings() const {
    return m_characterWarnings;
  }

  // Session-level failures (aggregated over all loading steps)
  const std::vector<std::string> &getLoadingErrors() const {
    return m_loadingErrors;
  }

  void addLog(const std::string &message);
  void clearLog() { m_logMessages.clear(); }
  const std::vector<std::string> &getLogMessages() const {
    return m_logMessages;
  }

private:
  CharacterRegistry m_characters{};
  std::optional<std::string> m_playerCharacterId{};
  std::vector<LoadIssue> m_characterErrors{};
  std::vector<LoadIssue> m_characterWarnings{};

  std::vector<std::string> m_logMessages{};
  std::vector<std::string> m_loadingErrors{};
  bool m_characterLoadComplete{false};
};

} // namespace TrekEngine

#endif // GAME_STATE_HPP
