/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHARACTER_LOADER_HPP
#define CHARACTER_LOADER_HPP

#include "core/LoadErrors.hpp"
#include "managers/CharacterRecordSource.hpp"
#include "managers/CharacterRegistry.hpp"
#include <boost/container/flat_map.hpp>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TrekEngine {

/**
 * @brief Everything one character load produced
 *
 * Move-only: the registry owns the characters and every relationship link
 * points into it. Moving keeps the links valid, copying could not.
 */
struct LoadResult {
  CharacterRegistry registry{};
  std::optional<std::string> playerId{};
  std::vector<std::string> log{};     // Chronological trace, errors included
  std::vector<LoadIssue> errors{};    // Failures, in the order they occurred
  std::vector<LoadIssue> warnings{};  // Dangling references, informational

  bool hasErrors() const { return !errors.empty(); }
  size_t countIssues(LoadIssueKind kind) const;
  const Character* getPlayer() const;
};

/**
 * @brief Turns a batch of raw character records into a linked registry
 *
 * A load runs in two phases. Every record is first converted into a
 * Character and registered (duplicates rejected, first occurrence wins, last
 * designated player wins). Only then are the relationship ids of each
 * registered character resolved against the complete registry.
 *
 * Per-record and per-relationship problems never abort the batch; they are
 * collected in LoadResult::errors / LoadResult::warnings and it is up to the
 * caller to decide whether they are fatal.
 *
 * Usage:
 *   CharacterLoader loader;
 *   LoadResult result = loader.load(records);
 *   if (result.hasErrors()) { ... }
 */
class CharacterLoader {
public:
  CharacterLoader() = default;
  ~CharacterLoader() = default;

  CharacterLoader(const CharacterLoader&) = delete;
  CharacterLoader& operator=(const CharacterLoader&) = delete;

  /**
   * @brief Loads, validates and links one batch of records
   * @param records Raw records in batch order
   * @return The populated result, always (errors are reported inside it)
   */
  LoadResult load(const std::vector<CharacterRecord>& records);

  /**
   * @brief Reads every record of a source and loads them as one batch
   * @param source Record source, e.g. a CharacterDirectorySource
   * @return std::nullopt if the source cannot be consulted at all
   */
  std::optional<LoadResult> loadFromSource(CharacterRecordSource& source);

private:
  LoadResult run(const std::vector<CharacterRecord>& records,
                 const std::string* sourceDescription);

  void reset();
  void addLog(const std::string& message);
  void addError(LoadIssueKind kind, const std::string& source,
                const std::string& message);
  void addWarning(const std::string& source, const std::string& message);

  std::vector<std::pair<std::string, std::unique_ptr<Character>>>
  constructCharacters(const std::vector<CharacterRecord>& records);
  void registerCharacters(
      std::vector<std::pair<std::string, std::unique_ptr<Character>>>&&
          constructed);
  void linkRelationships();
  void linkSpouse(Character& character);
  void linkList(Character& character, const std::vector<std::string>& ids,
                const char* relation,
                void (Character::*addLink)(const Character*));

  LoadResult m_result{};
  boost::container::flat_map<std::string, std::string> m_sourceById{};
};

} // namespace TrekEngine

#endif // CHARACTER_LOADER_HPP
