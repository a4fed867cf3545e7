/**
 * @file duplicatebrowserui.hpp
 * @brief Terminal user interface for browsing and removing duplicates (FTXUI)
 *
 * Key features:
 * - Asynchronous scan with spinner and live file counter
 * - Grouped list: one header row per duplicate group followed by its files
 * - Single-file deletion behind a confirmation dialog and SafeDeleter
 * - "Delete all duplicates" keeping the first file of every group
 *
 * @see DuplicateScanner
 * @see SafeDeleter
 */

#ifndef DUPLICATEBROWSERUI_HPP
#define DUPLICATEBROWSERUI_HPP

#include "duplicatescanner.hpp"
#include "ihashcalculator.hpp"
#include "scangeneration.hpp"
#include "scanpolicy.hpp"
#include "uicontrol.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace ftxui;

/**
 * @class DuplicateBrowserUI
 * @brief Full-screen duplicate browser
 *
 * Architecture:
 * - The scan runs through std::async; results are posted back to the UI
 *   thread with ScreenInteractive::Post
 * - An animation thread requests frames while scanning so the spinner moves
 * - m_rows maps each list entry back to its group and file
 */
class DuplicateBrowserUI {
private:
  // ===== Engine =====

  ScanPolicy m_policy;
  std::unique_ptr<IHashCalculator> m_hasher;
  std::unique_ptr<DuplicateScanner> m_scanner;
  std::uintmax_t m_min_bytes;
  bool m_verify;

  /** @brief Last completed scan; edited in place after single deletes */
  ScanResult m_result;

  // ===== UI State =====

  /**
   * @brief Position of a list entry inside m_result
   *
   * file_index is -1 for group header rows.
   */
  struct Row {
    int group_index;
    int file_index;
  };

  std::vector<Row> m_rows;
  std::vector<std::string> m_entries;
  int m_selected = 0;
  bool m_show_full_paths = true;

  std::string m_current_status = "Ready.";
  std::vector<std::string> m_menu_entries;
  int m_top_menu_selected = 0;

  ScreenInteractive m_screen = ScreenInteractive::Fullscreen();

  // ===== UI Components =====

  Component m_top_menu;
  Component m_list;
  Component m_main_view;
  Component m_document;

  // ===== Threading and Async Operations =====

  std::future<void> m_scan_future;
  /** @brief Closures posted by a superseded scan are dropped on arrival */
  ScanGeneration m_scan_generation;
  std::atomic<bool> m_loading{false};
  std::atomic<int> m_scanned_count{0};

  std::thread m_animation_thread;
  std::atomic<bool> m_animating{false};

  // ===== Setup =====

  void setupTopMenu();
  void setupList();
  void setupMainLayout();
  Component createPanel();

  // ===== Scanning =====

  /**
   * @brief Starts a scan in the background
   *
   * Waits for a previous scan first; the scanner is not reentrant. Results
   * still queued from the previous scan are ignored.
   */
  void startScanAsync();

  /** @brief Rebuilds rows and labels from m_result */
  void rebuildRows();

  std::string formatRow(const Row &row) const;
  std::string summaryStatus() const;

  // ===== Actions =====

  bool handleGlobalShortcut(char key);
  ActionID getActionIdByIndex(int index) const;
  void runAction(ActionID action);

  /**
   * @brief Deletes the file under the cursor after confirmation
   *
   * On success the file is removed from m_result and the totals are
   * adjusted; a group left with one file disappears.
   */
  void deleteSelected();

  void deleteAllDuplicates();

  /**
   * @brief Modal yes/no dialog
   *
   * @return true if the user pressed 'y'
   */
  bool showConfirmation(const std::string &title,
                        const std::vector<std::string> &lines);

  void startAnimation();
  void stopAnimation();

public:
  /**
   * @param roots Directories to scan
   * @param min_bytes Minimum file size
   * @param hasher Fingerprint strategy (ownership taken)
   * @param policy Engine configuration
   * @param verify Compare full contents before every delete
   */
  DuplicateBrowserUI(std::vector<std::filesystem::path> roots,
                     std::uintmax_t min_bytes,
                     std::unique_ptr<IHashCalculator> hasher,
                     const ScanPolicy &policy, bool verify);

  ~DuplicateBrowserUI();

  /** @brief Builds the components and starts the first scan */
  void initialize();

  /** @brief Runs the event loop until the user quits */
  void run();
};

#endif // DUPLICATEBROWSERUI_HPP
