/**
 * @file uicontrol.hpp
 * @brief UI action definitions and keyboard shortcut mappings
 *
 * The action system provides a centralized mapping between:
 * - Action identifiers (ActionID enum)
 * - Keyboard shortcuts (single character keys)
 * - Menu display strings (with shortcut hints)
 *
 * @see ActionID
 * @see ActionInfo
 * @see ActionMap
 */

#ifndef UI_CONTROL_HPP
#define UI_CONTROL_HPP

#include <map>
#include <string>
#include <vector>

/**
 * @struct ActionInfo
 * @brief Information about a UI action including shortcut and menu title
 */
struct ActionInfo {
  /** @brief Single character keyboard shortcut for this action */
  char m_shortcut;

  /** @brief Formatted menu title string including shortcut hint (e.g., "(q) Quit") */
  std::string m_menu_title;
};

/**
 * @enum ActionID
 * @brief Enumeration of all available UI actions
 *
 * Available Actions:
 * - Rescan: Run the duplicate scan again
 * - ToggleFullPaths: Switch between file names and full paths
 * - DeleteSelected: Delete the highlighted file with safety checks
 * - DeleteAllDuplicates: Keep the first file of each group, delete the rest
 * - Quit: Exit the application
 */
enum class ActionID {
  /** @brief Scan the roots again (shortcut: 'r') */
  Rescan,

  /** @brief Toggle full path display (shortcut: 'f') */
  ToggleFullPaths,

  /** @brief Delete highlighted file (shortcut: 'D') */
  DeleteSelected,

  /** @brief Delete every redundant copy (shortcut: 'A') */
  DeleteAllDuplicates,

  /** @brief Quit the application (shortcut: 'q') */
  Quit
};

/**
 * @brief Global mapping of actions to their shortcuts and menu titles
 *
 * @note Shortcuts are case-sensitive ('D' and 'A' are upper case so that
 *       destructive actions are harder to trigger by accident)
 */
inline const std::map<ActionID, ActionInfo> ActionMap = {
    {ActionID::Rescan, {'r', "(r) Rescan"}},
    {ActionID::ToggleFullPaths, {'f', "(f) Full Paths"}},
    {ActionID::DeleteSelected, {'D', "(D) Delete File"}},
    {ActionID::DeleteAllDuplicates, {'A', "(A) Delete All Duplicates"}},
    {ActionID::Quit, {'q', "(q) Quit"}}};

/**
 * @brief Extracts menu entry strings from the ActionMap
 *
 * @return Menu titles in ActionID order
 */
inline std::vector<std::string> getMenuEntries() {
  std::vector<std::string> entries;
  entries.reserve(ActionMap.size());
  for (const auto &[id, info] : ActionMap) {
    entries.push_back(info.m_menu_title);
  }
  return entries;
}

#endif // UI_CONTROL_HPP
