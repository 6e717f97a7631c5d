/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCEPATH_HPP
#define RESOURCEPATH_HPP

#include <string>
#include <vector>

namespace TrekEngine {

/**
 * ResourcePath - Locates data files (settings, character records) no matter
 * where the executable is started from.
 *
 * Search paths are tried in priority order. init() registers the project
 * root found above the executable directory (the first ancestor holding a
 * "res" directory) and the current working directory.
 *
 * Usage:
 *   ResourcePath::init();  // Call once at startup
 *   std::string dir = ResourcePath::resolve("res/data/characters");
 */
class ResourcePath {
public:
  /**
   * Registers the default search paths. Calling it again does nothing until
   * reset() is called.
   */
  static void init();

  /**
   * Forgets every search path and the initialized state.
   */
  static void reset();

  /**
   * Resolve a relative resource path against the search paths.
   *
   * @param relativePath Path relative to the resource root
   * @return Full path of the first match, or relativePath unchanged if there
   *         is no match (absolute paths are returned as-is)
   */
  static std::string resolve(const std::string& relativePath);

  static bool exists(const std::string& relativePath);

  /**
   * @param path Directory to search
   * @param priority Higher values are searched first (default: 0)
   */
  static void addSearchPath(const std::string& path, int priority = 0);
  static void removeSearchPath(const std::string& path);

  // Highest priority search path, or empty if none is registered
  static std::string getBasePath();

  static std::vector<std::string> getSearchPaths();

private:
  struct SearchPath {
    std::string path;
    int priority;
  };

  static std::vector<SearchPath> s_searchPaths;
  static bool s_initialized;

  static std::string getExecutablePath();
  static std::string findProjectRoot(const std::string& executableDir);
};

} // namespace TrekEngine

#endif // RESOURCEPATH_HPP
