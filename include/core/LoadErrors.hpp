/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOAD_ERRORS_HPP
#define LOAD_ERRORS_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace TrekEngine {

/**
 * @brief Thrown when a raw character record cannot become a Character
 *
 * Carries the name of the offending field (empty when the record as a whole
 * is unusable, e.g. not an object or not parseable).
 */
class ValidationError : public std::runtime_error {
public:
  ValidationError(const std::string &field, const std::string &message)
      : std::runtime_error(message), m_field(field) {}

  const std::string &getField() const { return m_field; }

private:
  std::string m_field;
};

/**
 * @brief Classification of everything a character load can report
 */
enum class LoadIssueKind : uint8_t {
  ValidationError = 0,         // Record dropped, batch continues
  DuplicateIdError = 1,        // Later record dropped, first one kept
  MultiplePlayersError = 2,    // Last designated player wins
  NoPlayerDesignatedError = 3, // Non-empty registry, no player
  DanglingReferenceWarning = 4 // Relationship id with no registry entry
};

// Stream operator for LoadIssueKind (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, LoadIssueKind kind) {
  switch (kind) {
  case LoadIssueKind::ValidationError:
    return os << "ValidationError";
  case LoadIssueKind::DuplicateIdError:
    return os << "DuplicateIdError";
  case LoadIssueKind::MultiplePlayersError:
    return os << "MultiplePlayersError";
  case LoadIssueKind::NoPlayerDesignatedError:
    return os << "NoPlayerDesignatedError";
  case LoadIssueKind::DanglingReferenceWarning:
    return os << "DanglingReferenceWarning";
  }
  return os << "Unknown";
}

struct LoadIssue {
  LoadIssueKind kind{LoadIssueKind::ValidationError};
  std::string source{}; // Record source (file name), empty for batch-level issues
  std::string message{};
};

} // namespace TrekEngine

#endif // LOAD_ERRORS_HPP
