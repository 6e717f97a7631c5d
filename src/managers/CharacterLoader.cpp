/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CharacterLoader.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace TrekEngine {

size_t LoadResult::countIssues(LoadIssueKind kind) const {
  const auto &issues =
      (kind == LoadIssueKind::DanglingReferenceWarning) ? warnings : errors;
  return static_cast<size_t>(
      std::count_if(issues.begin(), issues.end(),
                    [kind](const LoadIssue &issue) { return issue.kind == kind; }));
}

const Character *LoadResult::getPlayer() const {
  return playerId ? registry.find(*playerId) : nullptr;
}

LoadResult CharacterLoader::load(const std::vector<CharacterRecord> &records) {
  return run(records, nullptr);
}

std::optional<LoadResult>
CharacterLoader::loadFromSource(CharacterRecordSource &source) {
  const std::string description = source.describe();
  if (!source.isAvailable()) {
    LOADER_ERROR(std::format("Character source not available: '{}'",
                             description));
    return std::nullopt;
  }

  return run(source.readRecords(), &description);
}

LoadResult CharacterLoader::run(const std::vector<CharacterRecord> &records,
                                const std::string *sourceDescription) {
  reset();

  if (sourceDescription) {
    addLog(std::format("CharacterLoader: Starting character load from '{}'",
                       *sourceDescription));
    if (records.empty()) {
      addLog(std::format("WARN: No character records found in '{}'.",
                         *sourceDescription));
      LOADER_WARN(std::format("No character records found in '{}'",
                              *sourceDescription));
    }
  }
  addLog(std::format("CharacterLoader: Processing {} character records.",
                     records.size()));

  // Phase 1: build every character before anything is registered
  registerCharacters(constructCharacters(records));

  addLog(std::format("CharacterLoader: Successfully parsed and preliminarily "
                     "processed {} unique characters.",
                     m_result.registry.size()));

  if (!m_result.registry.empty() && !m_result.playerId) {
    addError(LoadIssueKind::NoPlayerDesignatedError, "",
             "No player character (is_player: true) was designated among the "
             "loaded characters.");
  }

  // Phase 2: resolve ids against the complete registry
  linkRelationships();

  if (m_result.hasErrors()) {
    addLog(std::format("CharacterLoader: Character loading and linking "
                       "completed with {} issues.",
                       m_result.errors.size()));
  } else {
    addLog("CharacterLoader: All characters loaded and linked successfully.");
  }

  LOADER_INFO(std::format("Loaded {} characters ({} errors, {} warnings)",
                          m_result.registry.size(), m_result.errors.size(),
                          m_result.warnings.size()));

  LoadResult result = std::move(m_result);
  reset();
  return result;
}

void CharacterLoader::reset() {
  m_result = LoadResult{};
  m_sourceById.clear();
}

void CharacterLoader::addLog(const std::string &message) {
  m_result.log.push_back(message);
}

void CharacterLoader::addError(LoadIssueKind kind, const std::string &source,
                               const std::string &message) {
  m_result.errors.push_back(LoadIssue{kind, source, message});
  addLog("ERROR: " + message);
  LOADER_ERROR(message);
}

void CharacterLoader::addWarning(const std::string &source,
                                 const std::string &message) {
  m_result.warnings.push_back(
      LoadIssue{LoadIssueKind::DanglingReferenceWarning, source, message});
  addLog("  WARN: " + message);
  LOADER_WARN(message);
}

std::vector<std::pair<std::string, std::unique_ptr<Character>>>
CharacterLoader::constructCharacters(
    const std::vector<CharacterRecord> &records) {
  std::vector<std::pair<std::string, std::unique_ptr<Character>>> constructed;
  constructed.reserve(records.size());

  for (size_t i = 0; i < records.size(); ++i) {
    const CharacterRecord &record = records[i];
    const std::string source = record.source.empty()
                                   ? std::format("record[{}]", i)
                                   : record.source;

    if (!record.parseError.empty()) {
      addError(LoadIssueKind::ValidationError, source,
               std::format("Failed to load or parse character file '{}': {}",
                           source, record.parseError));
      continue;
    }

    try {
      constructed.emplace_back(source,
                               std::make_unique<Character>(record.data));
    } catch (const ValidationError &e) {
      addError(LoadIssueKind::ValidationError, source,
               std::format("Failed to load character '{}': {}", source,
                           e.what()));
    }
  }

  return constructed;
}

void CharacterLoader::registerCharacters(
    std::vector<std::pair<std::string, std::unique_ptr<Character>>>
        &&constructed) {
  for (auto &[source, character] : constructed) {
    const std::string id = character->getId();
    const bool isPlayer = character->isPlayer();

    if (!m_result.registry.insert(std::move(character))) {
      addError(LoadIssueKind::DuplicateIdError, source,
               std::format("Duplicate character ID '{}' in '{}'. Original "
                           "kept, duplicate ignored.",
                           id, source));
      continue;
    }
    m_sourceById.emplace(id, source);

    if (isPlayer) {
      if (m_result.playerId) {
        addError(LoadIssueKind::MultiplePlayersError, source,
                 std::format("Multiple player characters defined! Old: {}, "
                             "New: {}. Using the latter: {}.",
                             *m_result.playerId, id, id));
      }
      m_result.playerId = id;
    }
  }
}

void CharacterLoader::linkRelationships() {
  addLog("CharacterLoader: Linking character relationships...");
  if (m_result.registry.empty()) {
    addLog("  No characters to link (character registry is empty).");
    return;
  }

  // Registry order is insertion order; each pass only writes the current
  // character's own link slots
  for (auto &character : m_result.registry.m_characters) {
    linkSpouse(*character);
    linkList(*character, character->getParentIds(), "parent",
             &Character::addParent);
    linkList(*character, character->getChildrenIds(), "child",
             &Character::addChild);
    linkList(*character, character->getSiblingIds(), "sibling",
             &Character::addSibling);
  }

  addLog("CharacterLoader: Character relationship linking attempt complete.");
}

void CharacterLoader::linkSpouse(Character &character) {
  const auto &spouseId = character.getSpouseId();
  if (!spouseId) {
    return;
  }

  const Character *spouse = m_result.registry.find(*spouseId);
  character.setSpouse(spouse);
  if (!spouse) {
    addWarning(m_sourceById[character.getId()],
               std::format("For character '{}', spouse ID '{}' not found in "
                           "loaded characters.",
                           character.getId(), *spouseId));
  }
}

void CharacterLoader::linkList(Character &character,
                               const std::vector<std::string> &ids,
                               const char *relation,
                               void (Character::*addLink)(const Character *)) {
  for (const auto &id : ids) {
    const Character *target = m_result.registry.find(id);
    if (target) {
      (character.*addLink)(target);
    } else {
      addWarning(m_sourceById[character.getId()],
                 std::format("For character '{}', {} ID '{}' not found.",
                             character.getId(), relation, id));
    }
  }
}

} // namespace TrekEngine
