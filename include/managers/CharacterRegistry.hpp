/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHARACTER_REGISTRY_HPP
#define CHARACTER_REGISTRY_HPP

#include "entities/Character.hpp"
#include <boost/container/flat_map.hpp>
#include <cstddef>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace TrekEngine {

/**
 * @brief Sole owner of every Character produced by a load
 *
 * Keeps insertion order for iteration and an id index for O(log n) lookups.
 * Characters are heap allocated so their addresses (and therefore every
 * relationship link) survive moving the registry.
 */
class CharacterRegistry {
public:
  using Storage = std::vector<std::unique_ptr<Character>>;

  // Iterates as const Character& in insertion order
  class const_iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Character;
    using difference_type = std::ptrdiff_t;
    using pointer = const Character*;
    using reference = const Character&;

    const_iterator() = default;
    explicit const_iterator(Storage::const_iterator it) : m_it(it) {}

    reference operator*() const { return **m_it; }
    pointer operator->() const { return m_it->get(); }
    const_iterator& operator++() {
      ++m_it;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator previous = *this;
      ++m_it;
      return previous;
    }
    bool operator==(const const_iterator& other) const {
      return m_it == other.m_it;
    }
    bool operator!=(const const_iterator& other) const {
      return m_it != other.m_it;
    }

  private:
    Storage::const_iterator m_it{};
  };

  CharacterRegistry() = default;
  ~CharacterRegistry() = default;

  CharacterRegistry(CharacterRegistry&&) = default;
  CharacterRegistry& operator=(CharacterRegistry&&) = default;

  CharacterRegistry(const CharacterRegistry&) = delete;
  CharacterRegistry& operator=(const CharacterRegistry&) = delete;

  bool contains(const std::string& id) const;

  /**
   * @brief Looks up a character by id
   * @return The character, or nullptr if no character has that id
   */
  const Character* find(const std::string& id) const;

  size_t size() const { return m_characters.size(); }
  bool empty() const { return m_characters.empty(); }

  // Ids in insertion order
  std::vector<std::string> ids() const;

  const_iterator begin() const { return const_iterator(m_characters.begin()); }
  const_iterator end() const { return const_iterator(m_characters.end()); }

private:
  friend class CharacterLoader;

  /**
   * @brief Takes ownership of a character unless its id is already taken
   * @return false (and leaves the registry unchanged) on a duplicate id
   */
  bool insert(std::unique_ptr<Character> character);

  Storage m_characters{};
  boost::container::flat_map<std::string, Character*> m_index{};
};

} // namespace TrekEngine

#endif // CHARACTER_REGISTRY_HPP
