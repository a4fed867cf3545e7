#include "userdirs.hpp"
#include <cstdlib>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

bool parseUserDirsLine(const std::string &line, const fs::path &home,
                       std::string &key, fs::path &value) {
  const auto first = line.find_first_not_of(" \t");
  if (first == std::string::npos || line[first] == '#') {
    return false;
  }

  const auto eq = line.find('=', first);
  if (eq == std::string::npos) {
    return false;
  }

  key = line.substr(first, eq - first);
  std::string raw = line.substr(eq + 1);

  // Strip surrounding quotes
  if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
    raw = raw.substr(1, raw.size() - 2);
  }
  if (raw.empty()) {
    return false;
  }

  const std::string homeVar = "$HOME";
  if (raw.compare(0, homeVar.size(), homeVar) == 0) {
    std::string rest = raw.substr(homeVar.size());
    if (!rest.empty() && rest.front() == '/') {
      rest.erase(0, 1);
    }
    value = rest.empty() ? home : home / rest;
  } else {
    value = raw;
  }

  return !key.empty();
}

std::vector<fs::path> wellKnownUserDirectories(const fs::path &homeDir) {
  fs::path home = homeDir;
  if (home.empty()) {
    const char *env = std::getenv("HOME");
    if (!env) {
      return {};
    }
    home = env;
  }

  // Key in user-dirs.dirs -> fallback folder name
  const std::vector<std::pair<std::string, std::string>> folders = {
      {"XDG_DESKTOP_DIR", "Desktop"},     {"XDG_DOCUMENTS_DIR", "Documents"},
      {"XDG_DOWNLOAD_DIR", "Downloads"},  {"XDG_PICTURES_DIR", "Pictures"},
      {"XDG_VIDEOS_DIR", "Videos"},       {"XDG_MUSIC_DIR", "Music"}};

  fs::path config = home / ".config";
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    config = xdg;
  }

  std::map<std::string, fs::path> configured;
  std::ifstream dirsFile(config / "user-dirs.dirs");
  std::string line;
  while (dirsFile && std::getline(dirsFile, line)) {
    std::string key;
    fs::path value;
    if (parseUserDirsLine(line, home, key, value)) {
      configured[key] = value;
    }
  }

  std::vector<fs::path> result;
  for (const auto &[key, fallback] : folders) {
    auto it = configured.find(key);
    fs::path dir = it != configured.end() ? it->second : home / fallback;

    // XDG points disabled folders at $HOME itself
    if (dir == home) {
      continue;
    }

    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
      result.push_back(dir);
    }
  }

  return result;
}
