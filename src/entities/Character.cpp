/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Character.hpp"
#include "core/LoadErrors.hpp"
#include "utils/JsonReader.hpp"
#include <array>
#include <format>
#include <sstream>

namespace TrekEngine {

namespace {

constexpr std::array<const char*, 5> REQUIRED_FIELDS{"id", "name", "age",
                                                     "gender", "bio"};

std::string requireString(const JsonValue& record, const char* field) {
  const JsonValue& value = record[field];
  if (!value.isString()) {
    throw ValidationError(
        field, std::format("Field '{}' must be a string", field));
  }
  return value.asString();
}

// Missing or null optional lists default to empty
std::vector<std::string> optionalStringList(const JsonValue& object,
                                            const char* field) {
  std::vector<std::string> result;
  const JsonValue& value = object[field];
  if (value.isNull()) {
    return result;
  }

  const JsonArray* items = value.tryAsArray();
  if (items == nullptr) {
    throw ValidationError(
        field, std::format("Field '{}' must be a list of strings", field));
  }

  result.reserve(items->size());
  for (const auto& item : *items) {
    if (!item.isString()) {
      throw ValidationError(
          field,
          std::format("Field '{}' contains a non-string entry: {}", field,
                      item.toString()));
    }
    result.push_back(item.asString());
  }
  return result;
}

RelationshipIds parseRelationshipIds(const JsonValue& record) {
  RelationshipIds ids;

  // Data files use "relationships", "relationship_ids" is accepted too
  const char* field = "relationships";
  if (!record.hasKey(field)) {
    field = "relationship_ids";
  }

  const JsonValue& relationships = record[field];
  if (relationships.isNull()) {
    return ids;
  }
  if (!relationships.isObject()) {
    throw ValidationError(
        field, std::format("Field '{}' must be an object", field));
  }

  // An empty spouse id means no spouse
  const JsonValue& spouse = relationships["spouse_id"];
  if (spouse.isString()) {
    if (!spouse.asString().empty()) {
      ids.spouseId = spouse.asString();
    }
  } else if (!spouse.isNull()) {
    throw ValidationError("spouse_id", "Field 'spouse_id' must be a string");
  }

  ids.parentIds = optionalStringList(relationships, "parent_ids");
  ids.childrenIds = optionalStringList(relationships, "children_ids");
  ids.siblingIds = optionalStringList(relationships, "sibling_ids");
  return ids;
}

std::string joinNames(const CharacterLinks& links) {
  std::string joined;
  for (const Character* link : links) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += link->getName();
  }
  return joined;
}

std::string joinStrings(const std::vector<std::string>& values) {
  std::string joined;
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined += ", ";
    }
    joined += value;
  }
  return joined;
}

} // anonymous namespace

Character::Character(const JsonValue& record) {
  if (!record.isObject()) {
    throw ValidationError("", "Character record is not a JSON object");
  }

  for (const char* field : REQUIRED_FIELDS) {
    if (!record.hasKey(field)) {
      throw ValidationError(
          field, std::format("Missing required field '{}'", field));
    }
  }

  m_id = requireString(record, "id");
  if (m_id.empty()) {
    throw ValidationError("id", "Field 'id' must not be empty");
  }

  m_name = requireString(record, "name");

  std::optional<int> age = record["age"].tryAsInt();
  if (!age) {
    throw ValidationError("age", "Field 'age' must be an integer");
  }
  m_age = *age;

  m_gender = requireString(record, "gender");
  m_bio = requireString(record, "bio");

  const JsonValue& isPlayer = record["is_player"];
  if (isPlayer.isBool()) {
    m_isPlayer = isPlayer.asBool();
  } else if (!isPlayer.isNull()) {
    throw ValidationError("is_player", "Field 'is_player' must be a boolean");
  }

  m_traits = optionalStringList(record, "traits");
  m_skills = optionalStringList(record, "skills");
  m_assets = optionalStringList(record, "assets");
  m_relationshipIds = parseRelationshipIds(record);
}

std::string Character::getShortDescription() const {
  return std::format("{} ({}{})", m_name, m_age, m_gender);
}

std::string Character::getFullBioDisplay() const {
  std::ostringstream out;
  out << "Name: " << m_name << '\n'
      << "ID: " << m_id << '\n'
      << "Age: " << m_age << '\n'
      << "Gender: " << m_gender << '\n'
      << "Bio:\n";

  if (m_bio.empty()) {
    out << "  N/A";
  } else {
    out << "  ";
    for (char c : m_bio) {
      out << c;
      if (c == '\n') {
        out << "  ";
      }
    }
  }

  if (!m_traits.empty()) {
    out << "\nTraits: " << joinStrings(m_traits);
  }
  if (!m_skills.empty()) {
    out << "\nNotable Skills: " << joinStrings(m_skills);
  }
  if (!m_assets.empty()) {
    out << "\nAssets: " << joinStrings(m_assets);
  }
  return out.str();
}

std::string Character::getFamilyInfoDisplay() const {
  std::ostringstream out;
  out << "Family Information:\n";

  if (m_spouse) {
    out << std::format("  Spouse: {} (ID: {})", m_spouse->getName(),
                       m_spouse->getId());
  } else {
    out << "  Spouse: None";
  }

  out << "\n  Parents: " << (m_parents.empty() ? "Unknown" : joinNames(m_parents));
  out << "\n  Children: " << (m_children.empty() ? "None" : joinNames(m_children));

  if (!m_siblings.empty()) {
    out << "\n  Siblings: " << joinNames(m_siblings);
  }
  return out.str();
}

std::string Character::toString() const {
  return std::format("Character(id='{}', name='{}', age={})", m_id, m_name,
                     m_age);
}

} // namespace TrekEngine
