#ifndef USERDIRS_HPP
#define USERDIRS_HPP

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Resolves the user's well-known folders used as default scan roots
 *
 * Desktop, Documents, Downloads, Pictures, Videos and Music are looked up
 * in $XDG_CONFIG_HOME/user-dirs.dirs (or ~/.config/user-dirs.dirs) and fall
 * back to $HOME/<Name>. Only directories that exist are returned.
 *
 * @param home Home directory; empty means $HOME
 */
std::vector<std::filesystem::path> wellKnownUserDirectories(
    const std::filesystem::path &home = {});

/**
 * @brief Parses one user-dirs.dirs line such as XDG_MUSIC_DIR="$HOME/Music"
 *
 * @param line Line from the file
 * @param home Replacement for a leading $HOME
 * @param key Receives the variable name (e.g. "XDG_MUSIC_DIR")
 * @param value Receives the expanded path
 * @return false for comments, blank or malformed lines
 */
bool parseUserDirsLine(const std::string &line,
                       const std::filesystem::path &home, std::string &key,
                       std::filesystem::path &value);

#endif // USERDIRS_HPP
