/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef CHARACTER_HPP
#define CHARACTER_HPP

#include <boost/container/small_vector.hpp>
#include <optional>
#include <string>
#include <vector>

namespace TrekEngine {

class Character;
class JsonValue;

// Non-owning links into the CharacterRegistry that owns every Character
using CharacterLinks = boost::container::small_vector<const Character*, 4>;

/**
 * @brief Relationship identifiers exactly as they appear in the record
 */
struct RelationshipIds {
  std::optional<std::string> spouseId{};
  std::vector<std::string> parentIds{};
  std::vector<std::string> childrenIds{};
  std::vector<std::string> siblingIds{};
};

/**
 * @brief One character definition loaded from a data record
 *
 * Base attributes are fixed at construction. Relationship links start empty
 * and are filled in by CharacterLoader once every record of the batch has
 * been registered, so a Character never resolves anything on its own.
 */
class Character {
public:
  /**
   * @brief Builds a character from a raw record
   * @param record JSON object with at least id, name, age, gender and bio
   * @throws ValidationError naming the first missing or malformed field
   */
  explicit Character(const JsonValue& record);

  ~Character() = default;

  // Links point at registry-owned neighbours, copies would alias them
  Character(const Character&) = delete;
  Character& operator=(const Character&) = delete;

  // Base attributes
  const std::string& getId() const { return m_id; }
  const std::string& getName() const { return m_name; }
  int getAge() const { return m_age; }
  const std::string& getGender() const { return m_gender; }
  const std::string& getBio() const { return m_bio; }
  bool isPlayer() const { return m_isPlayer; }
  const std::vector<std::string>& getTraits() const { return m_traits; }
  const std::vector<std::string>& getSkills() const { return m_skills; }
  const std::vector<std::string>& getAssets() const { return m_assets; }

  // Raw relationship ids, the loader's only input for linking
  const std::optional<std::string>& getSpouseId() const {
    return m_relationshipIds.spouseId;
  }
  const std::vector<std::string>& getParentIds() const {
    return m_relationshipIds.parentIds;
  }
  const std::vector<std::string>& getChildrenIds() const {
    return m_relationshipIds.childrenIds;
  }
  const std::vector<std::string>& getSiblingIds() const {
    return m_relationshipIds.siblingIds;
  }

  // Resolved links (nullptr / empty until the loader has linked the batch)
  const Character* getSpouse() const { return m_spouse; }
  const CharacterLinks& getParents() const { return m_parents; }
  const CharacterLinks& getChildren() const { return m_children; }
  const CharacterLinks& getSiblings() const { return m_siblings; }

  /**
   * @brief One-line summary, e.g. "Jane (30F)"
   */
  std::string getShortDescription() const;

  /**
   * @brief Multi-line block with identity, indented bio, traits, skills, assets
   */
  std::string getFullBioDisplay() const;

  /**
   * @brief Multi-line block describing the resolved family links
   */
  std::string getFamilyInfoDisplay() const;

  std::string toString() const;

private:
  friend class CharacterLoader;

  void setSpouse(const Character* spouse) { m_spouse = spouse; }
  void addParent(const Character* parent) { m_parents.push_back(parent); }
  void addChild(const Character* child) { m_children.push_back(child); }
  void addSibling(const Character* sibling) { m_siblings.push_back(sibling); }

  std::string m_id{};
  std::string m_name{};
  int m_age{0};
  std::string m_gender{};
  std::string m_bio{};
  bool m_isPlayer{false};
  std::vector<std::string> m_traits{};
  std::vector<std::string> m_skills{};
  std::vector<std::string> m_assets{};
  RelationshipIds m_relationshipIds{};

  const Character* m_spouse{nullptr};
  CharacterLinks m_parents{};
  CharacterLinks m_children{};
  CharacterLinks m_siblings{};
};

} // namespace TrekEngine

#endif // CHARACTER_HPP
