/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHARACTER_RECORD_SOURCE_HPP
#define CHARACTER_RECORD_SOURCE_HPP

#include "utils/JsonReader.hpp"
#include <string>
#include <utility>
#include <vector>

namespace TrekEngine {

/**
 * @brief One raw character record plus where it came from
 */
struct CharacterRecord {
  std::string source{};     // File name or other identifier used in messages
  JsonValue data{};         // Expected to be a JSON object
  std::string parseError{}; // Set when the source could not parse the record

  CharacterRecord() = default;
  CharacterRecord(std::string recordSource, JsonValue recordData)
      : source(std::move(recordSource)), data(std::move(recordData)) {}
};

/**
 * @brief Produces the raw records of one character batch
 */
class CharacterRecordSource {
public:
  virtual ~CharacterRecordSource() = default;

  // Human readable description for logs, e.g. the directory path
  virtual std::string describe() const = 0;

  // False when the source cannot be consulted at all
  virtual bool isAvailable() const = 0;

  virtual std::vector<CharacterRecord> readRecords() = 0;
};

/**
 * @brief Serves records that are already in memory (fixtures, tools, tests)
 */
class CharacterMemorySource : public CharacterRecordSource {
public:
  explicit CharacterMemorySource(std::vector<CharacterRecord> records,
                                 std::string description = "memory")
      : m_records(std::move(records)), m_description(std::move(description)) {}

  std::string describe() const override { return m_description; }
  bool isAvailable() const override { return true; }
  std::vector<CharacterRecord> readRecords() override { return m_records; }

private:
  std::vector<CharacterRecord> m_records;
  std::string m_description;
};

/**
 * @brief Reads one character per file from a directory
 *
 * Files are matched by extension (case-insensitive) and read in file name
 * order so that batches are deterministic across platforms. A file that
 * cannot be read or parsed still yields a record, with parseError set, so
 * the loader can report it against the file name.
 *
 * Usage:
 *   CharacterDirectorySource source("res/data/characters");
 *   auto result = CharacterLoader().loadFromSource(source);
 */
class CharacterDirectorySource : public CharacterRecordSource {
public:
  explicit CharacterDirectorySource(std::string directory,
                                    std::vector<std::string> extensions = {
                                        ".json"});

  std::string describe() const override { return m_directory; }
  bool isAvailable() const override;
  std::vector<CharacterRecord> readRecords() override;

private:
  bool hasMatchingExtension(const std::string& extension) const;

  std::string m_directory;
  std::vector<std::string> m_extensions; // Stored lower case, with the dot
};

} // namespace TrekEngine

#endif // CHARACTER_RECORD_SOURCE_HPP
