/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/ResourcePath.hpp"
#include "core/Logger.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <filesystem>
#include <format>
#include <system_error>

namespace TrekEngine {

namespace fs = std::filesystem;

std::vector<ResourcePath::SearchPath> ResourcePath::s_searchPaths;
bool ResourcePath::s_initialized = false;

namespace {

// Build trees put the executable a few levels below the project root
constexpr int MAX_ROOT_SEARCH_DEPTH = 4;

// The project root ranks above the working directory
constexpr int PROJECT_ROOT_PRIORITY = 10;
constexpr int WORKING_DIR_PRIORITY = 0;

bool isDirectory(const fs::path& path) {
  std::error_code ec;
  return fs::is_directory(path, ec);
}

bool pathExists(const fs::path& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

} // namespace

void ResourcePath::init() {
  if (s_initialized) {
    return;
  }

  const std::string executableDir = getExecutablePath();
  const std::string projectRoot = findProjectRoot(executableDir);
  if (!projectRoot.empty()) {
    addSearchPath(projectRoot, PROJECT_ROOT_PRIORITY);
  } else {
    RESOURCEPATH_WARN(std::format("No 'res' directory found above {}",
                                  executableDir));
  }

  std::error_code ec;
  fs::path workingDir = fs::current_path(ec);
  if (!ec) {
    addSearchPath(workingDir.string(), WORKING_DIR_PRIORITY);
  }

  s_initialized = true;
  RESOURCEPATH_INFO(std::format("Base path = {}", getBasePath()));
}

void ResourcePath::reset() {
  s_searchPaths.clear();
  s_initialized = false;
}

std::string ResourcePath::getExecutablePath() {
  // SDL3 owns the returned string, nothing to free
  const char* basePath = SDL_GetBasePath();
  if (basePath && basePath[0] != '\0') {
    return std::string(basePath);
  }

  RESOURCEPATH_WARN(std::format("SDL_GetBasePath failed: {}", SDL_GetError()));
  std::error_code ec;
  fs::path workingDir = fs::current_path(ec);
  return ec ? std::string(".") : workingDir.string();
}

std::string ResourcePath::findProjectRoot(const std::string& executableDir) {
  fs::path current = fs::path(executableDir).lexically_normal();
  if (!current.empty() && current.filename().empty()) {
    current = current.parent_path(); // Strip the trailing separator
  }

  for (int depth = 0; depth <= MAX_ROOT_SEARCH_DEPTH && !current.empty();
       ++depth) {
    if (isDirectory(current / "res")) {
      return current.string();
    }
    fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }
  return "";
}

std::string ResourcePath::resolve(const std::string& relativePath) {
  if (fs::path(relativePath).is_absolute()) {
    return relativePath;
  }

  for (const auto& searchPath : s_searchPaths) {
    fs::path fullPath = fs::path(searchPath.path) / relativePath;
    if (pathExists(fullPath)) {
      return fullPath.string();
    }
  }

  // Unchanged, so the caller reports the path it asked for
  return relativePath;
}

bool ResourcePath::exists(const std::string& relativePath) {
  if (fs::path(relativePath).is_absolute() || s_searchPaths.empty()) {
    return pathExists(relativePath);
  }

  return std::any_of(s_searchPaths.begin(), s_searchPaths.end(),
                     [&relativePath](const SearchPath& searchPath) {
                       return pathExists(fs::path(searchPath.path) /
                                         relativePath);
                     });
}

void ResourcePath::addSearchPath(const std::string& path, int priority) {
  auto it = std::find_if(s_searchPaths.begin(), s_searchPaths.end(),
                         [&path](const SearchPath& sp) { return sp.path == path; });

  if (it != s_searchPaths.end()) {
    it->priority = priority;
  } else {
    s_searchPaths.push_back({path, priority});
  }

  // Highest priority first, insertion order among equals
  std::stable_sort(s_searchPaths.begin(), s_searchPaths.end(),
                   [](const SearchPath& a, const SearchPath& b) {
                     return a.priority > b.priority;
                   });
}

void ResourcePath::removeSearchPath(const std::string& path) {
  s_searchPaths.erase(
      std::remove_if(s_searchPaths.begin(), s_searchPaths.end(),
                     [&path](const SearchPath& sp) { return sp.path == path; }),
      s_searchPaths.end());
}

std::string ResourcePath::getBasePath() {
  return s_searchPaths.empty() ? std::string() : s_searchPaths.front().path;
}

std::vector<std::string> ResourcePath::getSearchPaths() {
  std::vector<std::string> paths;
  paths.reserve(s_searchPaths.size());
  for (const auto& searchPath : s_searchPaths) {
    paths.push_back(searchPath.path);
  }
  return paths;
}

} // namespace TrekEngine
