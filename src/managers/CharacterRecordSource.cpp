/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/CharacterRecordSource.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

namespace TrekEngine {

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return text;
}

} // anonymous namespace

CharacterDirectorySource::CharacterDirectorySource(
    std::string directory, std::vector<std::string> extensions)
    : m_directory(std::move(directory)) {
  m_extensions.reserve(extensions.size());
  for (auto& extension : extensions) {
    if (extension.empty()) {
      continue;
    }
    if (extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    m_extensions.push_back(toLower(std::move(extension)));
  }
}

bool CharacterDirectorySource::isAvailable() const {
  std::error_code ec;
  return fs::is_directory(m_directory, ec);
}

bool CharacterDirectorySource::hasMatchingExtension(
    const std::string& extension) const {
  std::string lowered = toLower(extension);
  return std::find(m_extensions.begin(), m_extensions.end(), lowered) !=
         m_extensions.end();
}

std::vector<CharacterRecord> CharacterDirectorySource::readRecords() {
  std::vector<CharacterRecord> records;

  std::vector<fs::path> files;
  try {
    for (const auto& entry : fs::directory_iterator(m_directory)) {
      std::error_code typeError;
      if (entry.is_regular_file(typeError) &&
          hasMatchingExtension(entry.path().extension().string())) {
        files.push_back(entry.path());
      }
    }
  } catch (const fs::filesystem_error& e) {
    RECORDSOURCE_ERROR(std::format("Failed to list directory '{}': {}",
                                   m_directory, e.what()));
    return records;
  }

  std::sort(files.begin(), files.end(),
            [](const fs::path& a, const fs::path& b) {
              return a.filename().string() < b.filename().string();
            });

  RECORDSOURCE_INFO(std::format("Found {} potential character files in '{}'",
                                files.size(), m_directory));

  records.reserve(files.size());
  for (const auto& path : files) {
    CharacterRecord record;
    record.source = path.filename().string();

    JsonReader reader;
    if (reader.loadFromFile(path.string())) {
      record.data = reader.getRoot();
    } else {
      record.parseError = reader.getLastError();
      RECORDSOURCE_WARN(std::format("Could not parse '{}': {}", record.source,
                                    record.parseError));
    }
    records.push_back(std::move(record));
  }

  return records;
}

} // namespace TrekEngine
