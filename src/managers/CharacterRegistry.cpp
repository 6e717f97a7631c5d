/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CharacterRegistry.hpp"
#include "core/Logger.hpp"

namespace TrekEngine {

bool CharacterRegistry::contains(const std::string& id) const {
  return m_index.find(id) != m_index.end();
}

const Character* CharacterRegistry::find(const std::string& id) const {
  auto it = m_index.find(id);
  return (it != m_index.end()) ? it->second : nullptr;
}

std::vector<std::string> CharacterRegistry::ids() const {
  std::vector<std::string> result;
  result.reserve(m_characters.size());
  for (const auto& character : m_characters) {
    result.push_back(character->getId());
  }
  return result;
}

bool CharacterRegistry::insert(std::unique_ptr<Character> character) {
  if (!character) {
    REGISTRY_ERROR("CharacterRegistry::insert - Null character provided");
    return false;
  }

  const std::string& id = character->getId();
  if (contains(id)) {
    REGISTRY_DEBUG("CharacterRegistry::insert - Id already registered: " + id);
    return false;
  }

  m_index.emplace(id, character.get());
  m_characters.push_back(std::move(character));
  return true;
}

} // namespace TrekEngine
