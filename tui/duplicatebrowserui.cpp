/**
 * @file duplicatebrowserui.cpp
 * @brief Implementation of the DuplicateBrowserUI class
 *
 * Key implementation areas:
 * - Destructor and resource cleanup
 * - Asynchronous scanning with progress tracking
 * - Row model built from the ScanResult
 * - UI setup and layout configuration
 * - Delete operations through SafeDeleter
 * - Animation thread management
 *
 * @see DuplicateBrowserUI
 */

#include "duplicatebrowserui.hpp"
#include "utils.hpp"

#include <algorithm>
#include <iostream>

namespace {

const std::string kHeaderPrefix = "# ";
const std::string kKeepPrefix = "    [keep] ";
const std::string kCopyPrefix = "           ";

bool startsWith(const std::string &text, const std::string &prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

DuplicateBrowserUI::DuplicateBrowserUI(
    std::vector<std::filesystem::path> roots, std::uintmax_t min_bytes,
    std::unique_ptr<IHashCalculator> hasher, const ScanPolicy &policy,
    bool verify)
    : m_policy(policy), m_hasher(std::move(hasher)), m_min_bytes(min_bytes),
      m_verify(verify) {
  m_scanner =
      std::make_unique<DuplicateScanner>(std::move(roots), *m_hasher, m_policy);
  m_scanner->setProgressCallback([this](int count) { m_scanned_count = count; });
}

DuplicateBrowserUI::~DuplicateBrowserUI() {
  stopAnimation();

  // Wait for background scan to complete
  if (m_scan_future.valid()) {
    m_scan_future.wait();
  }

  // FTXUI leaves the terminal in a clean state only after some output
  std::cout << "dupescan terminated. Final status: " << m_current_status
            << std::endl;
}

// ============================================================================
// ASYNC SCANNING
// ============================================================================

/**
 * @brief Runs DuplicateScanner::scan() in a background thread
 *
 * Implementation flow:
 * 1. Waits for any running scan
 * 2. Clears the list and starts the spinner
 * 3. Scans via std::async; the scanner reports progress into
 *    m_scanned_count
 * 4. Posts the result back to the UI thread, which rebuilds the rows
 *
 * Each scan takes a generation ticket. The scan thread of a previous run
 * may already have posted its result before this call waited for it; that
 * closure still runs on the UI thread later and is discarded because its
 * ticket is stale.
 */
void DuplicateBrowserUI::startScanAsync() {
  if (m_scan_future.valid()) {
    m_scan_future.wait();
  }

  const ScanGeneration::Ticket ticket = m_scan_generation.advance();
  m_loading = true;
  m_scanned_count = 0;
  m_result = ScanResult();
  m_rows.clear();
  m_entries.clear();
  m_selected = 0;

  startAnimation();

  m_scan_future = std::async(std::launch::async, [this, ticket]() {
    try {
      ScanResult result = m_scanner->scan(m_min_bytes);

      m_screen.Post([this, ticket, result]() {
        if (!m_scan_generation.isCurrent(ticket)) {
          return;
        }
        m_result = result;
        rebuildRows();
        m_current_status = summaryStatus();
        m_loading = false;
        stopAnimation();
      });
    } catch (const std::exception &e) {
      std::string reason = e.what();
      m_screen.Post([this, ticket, reason]() {
        if (!m_scan_generation.isCurrent(ticket)) {
          return;
        }
        m_current_status = "Scan failed: " + reason;
        m_loading = false;
        stopAnimation();
      });
    }
  });
}

// ============================================================================
// ROW MODEL
// ============================================================================

void DuplicateBrowserUI::rebuildRows() {
  m_rows.clear();
  m_entries.clear();

  for (int g = 0; g < static_cast<int>(m_result.groups.size()); ++g) {
    m_rows.push_back({g, -1});
    const auto &group = m_result.groups[static_cast<size_t>(g)];
    for (int f = 0; f < static_cast<int>(group.files.size()); ++f) {
      m_rows.push_back({g, f});
    }
  }

  m_entries.reserve(m_rows.size());
  for (const auto &row : m_rows) {
    m_entries.push_back(formatRow(row));
  }

  if (m_selected >= static_cast<int>(m_entries.size())) {
    m_selected = std::max(0, static_cast<int>(m_entries.size()) - 1);
  }
}

std::string DuplicateBrowserUI::formatRow(const Row &row) const {
  const auto &group = m_result.groups[static_cast<size_t>(row.group_index)];

  if (row.file_index < 0) {
    return kHeaderPrefix + group.fingerprint + "  " +
           std::to_string(group.count) + " x " + formatBytes(group.size) +
           "  (" + formatBytes(group.wastedBytes) + " wasted)";
  }

  const auto &file = group.files[static_cast<size_t>(row.file_index)];
  std::string name = m_show_full_paths
                         ? file.path
                         : std::filesystem::path(file.path).filename().string();

  std::string label = (row.file_index == 0 ? kKeepPrefix : kCopyPrefix) + name +
                      "  " + formatBytes(file.size) + "  " + file.age;
  if (!file.extension.empty()) {
    label += "  ." + file.extension;
  }
  return label;
}

std::string DuplicateBrowserUI::summaryStatus() const {
  return std::to_string(m_result.filesScanned) + " files scanned, " +
         std::to_string(m_result.totalDuplicates) + " duplicates, " +
         formatBytes(m_result.totalWasted) + " wasted (" +
         std::to_string(m_result.groups.size()) + " groups shown, " +
         std::to_string(m_result.elapsed.count()) + " ms).";
}

// ============================================================================
// UI SETUP
// ============================================================================

void DuplicateBrowserUI::initialize() {
  setupTopMenu();
  setupList();
  setupMainLayout();

  startScanAsync();
}

void DuplicateBrowserUI::setupTopMenu() {
  m_menu_entries = ::getMenuEntries(); // from uicontrol.hpp
  m_top_menu =
      Menu(&m_menu_entries, &m_top_menu_selected, MenuOption::Horizontal());

  m_top_menu = m_top_menu | CatchEvent([this](Event event) {
                 if (event == Event::Return) {
                   runAction(getActionIdByIndex(m_top_menu_selected));
                   return true;
                 }
                 return false;
               });
}

/**
 * @brief Creates the grouped list
 *
 * Rendering:
 * - Group headers in cyan and bold
 * - The file that "delete all" keeps in green, other copies in yellow
 * - Selected row inverted
 */
void DuplicateBrowserUI::setupList() {
  auto menu_option = MenuOption::Vertical();
  menu_option.entries_option.transform = [](EntryState state) {
    auto element = text(state.label);

    if (startsWith(state.label, kHeaderPrefix)) {
      element = element | bold | color(Color::Cyan);
    } else if (startsWith(state.label, kKeepPrefix)) {
      element = element | color(Color::Green);
    } else {
      element = element | color(Color::Yellow);
    }

    if (state.focused) {
      element = element | inverted;
    }
    return element;
  };

  m_list = Menu(&m_entries, &m_selected, menu_option);
  m_main_view = createPanel();
}

/**
 * @brief Panel renderer with a loading state and a normal state
 *
 * While scanning a spinner and the live file counter are shown; afterwards
 * the grouped list fills the available height.
 */
Component DuplicateBrowserUI::createPanel() {
  return Renderer(m_list, [this] {
    int terminal_height = Terminal::Size().dimy;
    int available_height = std::max(5, terminal_height - 9);

    // LOADING STATE
    if (m_loading) {
      static const std::vector<std::string> spinner = {"⠋", "⠙", "⠹", "⠸", "⠼",
                                                       "⠴", "⠦", "⠧", "⠇", "⠏"};
      static size_t frame = 0;
      frame = (frame + 1) % spinner.size();

      return vbox({text("Scanning for duplicates") | bold | color(Color::Green),
                   separator(),
                   vbox({text("") | flex,
                         hbox({text(spinner[frame]) | color(Color::Cyan) |
                                   bold | size(WIDTH, EQUAL, 2),
                               text("Walking directories and hashing...") |
                                   color(Color::GrayLight)}) |
                             center,
                         text("") | size(HEIGHT, EQUAL, 1),
                         text("Files scanned: " +
                              std::to_string(m_scanned_count.load())) |
                             color(Color::Yellow) | center,
                         text("") | flex}) |
                       flex}) |
             border;
    }

    // NORMAL STATE
    if (m_entries.empty()) {
      return vbox({text("Duplicate groups") | bold | color(Color::Green),
                   separator(),
                   text("No duplicate files found.") | center | flex}) |
             border;
    }

    return vbox({text("Duplicate groups") | bold | color(Color::Green),
                 separator(),
                 m_list->Render() | vscroll_indicator | frame |
                     size(HEIGHT, EQUAL, available_height)}) |
           border;
  });
}

void DuplicateBrowserUI::setupMainLayout() {
  m_document =
      Container::Vertical({m_top_menu, Renderer([] { return separator(); }),
                           m_main_view | flex, Renderer([this] {
                             return text("STATUS: " + m_current_status) |
                                    color(Color::GrayLight) | hcenter;
                           })});
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void DuplicateBrowserUI::run() {
  auto global_handler = CatchEvent(m_document, [this](Event event) {
    if (event.is_character()) {
      return handleGlobalShortcut(event.character()[0]);
    }
    return false;
  });

  m_screen.Loop(global_handler);
}

// ============================================================================
// KEYBOARD SHORTCUTS AND ACTIONS
// ============================================================================

ActionID DuplicateBrowserUI::getActionIdByIndex(int index) const {
  if (index < 0 || index >= static_cast<int>(ActionMap.size())) {
    return ActionID::Quit; // Fallback in case of invalid index
  }

  auto it = ActionMap.begin();
  std::advance(it, index);
  return it->first;
}

bool DuplicateBrowserUI::handleGlobalShortcut(char key_pressed) {
  for (const auto &pair : ActionMap) {
    if (key_pressed == pair.second.m_shortcut) {
      runAction(pair.first);
      return true;
    }
  }
  return false;
}

void DuplicateBrowserUI::runAction(ActionID action) {
  if (m_loading && action != ActionID::Quit) {
    m_current_status = "Scan in progress...";
    return;
  }

  switch (action) {
  case ActionID::Quit:
    m_screen.Exit();
    break;

  case ActionID::Rescan:
    startScanAsync();
    break;

  case ActionID::ToggleFullPaths:
    m_show_full_paths = !m_show_full_paths;
    rebuildRows();
    break;

  case ActionID::DeleteSelected:
    deleteSelected();
    break;

  case ActionID::DeleteAllDuplicates:
    deleteAllDuplicates();
    break;
  }
}

// ============================================================================
// DELETE OPERATIONS
// ============================================================================

void DuplicateBrowserUI::deleteSelected() {
  const Row *row = safe_at(m_rows, m_selected);
  if (!row || row->file_index < 0) {
    m_current_status = "No file selected.";
    return;
  }

  const size_t g = static_cast<size_t>(row->group_index);
  const size_t f = static_cast<size_t>(row->file_index);
  PresentedGroup &group = m_result.groups[g];
  const FilePresentation file = group.files[f];

  if (!showConfirmation("DELETE FILE?",
                        {"Path: " + file.path,
                         "Size: " + formatBytes(file.size),
                         "This cannot be undone."})) {
    m_current_status = "Delete cancelled.";
    return;
  }

  // In verify mode compare against another member of the group
  SafeDeleter::DeleteResult outcome =
      m_verify ? SafeDeleter(m_policy).removeVerified(
                     file.path, group.files[f == 0 ? 1 : 0].path)
               : m_scanner->deleteFile(file.path);

  if (!outcome.ok()) {
    m_current_status = "✗ " + outcome.message;
    return;
  }

  group.files.erase(group.files.begin() + static_cast<std::ptrdiff_t>(f));
  group.count = group.files.size();
  group.wastedBytes -= group.size;
  m_result.totalWasted -= group.size;
  m_result.totalDuplicates -= 1;

  if (group.files.size() < 2) {
    m_result.groups.erase(m_result.groups.begin() +
                          static_cast<std::ptrdiff_t>(g));
  }

  rebuildRows();
  m_current_status = "✓ " + outcome.message;
}

void DuplicateBrowserUI::deleteAllDuplicates() {
  if (m_result.groups.empty()) {
    m_current_status = "No duplicates to delete.";
    return;
  }

  std::size_t copies = 0;
  std::uintmax_t bytes = 0;
  for (const auto &group : m_result.groups) {
    copies += group.count - 1;
    bytes += group.wastedBytes;
  }

  if (!showConfirmation("DELETE ALL DUPLICATES?",
                        {"Files: " + std::to_string(copies) + " in " +
                             std::to_string(m_result.groups.size()) + " groups",
                         "Space: " + formatBytes(bytes),
                         "The first file of each group is kept.",
                         "This cannot be undone."})) {
    m_current_status = "Delete cancelled.";
    return;
  }

  auto report = m_scanner->deleteAllDuplicates(m_result, m_verify);

  startScanAsync();
  m_current_status = "Deleted " + std::to_string(report.deleted) +
                     " files (" + formatBytes(report.reclaimedBytes) +
                     "), " + std::to_string(report.failed) + " failed.";
}

/**
 * @brief Displays a modal confirmation dialog
 *
 * User input handling:
 * - 'y'/'Y': Confirms
 * - 'n'/'N'/ESC: Cancels
 */
bool DuplicateBrowserUI::showConfirmation(const std::string &title,
                                          const std::vector<std::string> &lines) {
  bool confirmed = false;
  auto dialog_screen = ScreenInteractive::TerminalOutput();

  auto dialog_renderer = Renderer([&] {
    std::vector<Element> content = {
        text(title) | bold | color(Color::Red) | hcenter, separator()};
    for (const auto &line : lines) {
      content.push_back(text(line) | color(Color::Yellow));
    }

    content.push_back(separator());
    content.push_back(
        hbox({text("Press ") | color(Color::GrayLight),
              text("'y'") | bold | color(Color::Green),
              text(" to confirm, ") | color(Color::GrayLight),
              text("'n'") | bold | color(Color::Red),
              text(" or ") | color(Color::GrayLight), text("ESC") | bold,
              text(" to cancel") | color(Color::GrayLight)}) |
        hcenter);

    return vbox(content) | border | center;
  });

  auto dialog_handler = CatchEvent(dialog_renderer, [&](Event event) {
    if (event == Event::Character('y') || event == Event::Character('Y')) {
      confirmed = true;
      dialog_screen.Exit();
      return true;
    }
    if (event == Event::Character('n') || event == Event::Character('N') ||
        event == Event::Escape) {
      confirmed = false;
      dialog_screen.Exit();
      return true;
    }
    return false;
  });

  dialog_screen.Loop(dialog_handler);
  return confirmed;
}

// ============================================================================
// ANIMATION THREAD
// ============================================================================

void DuplicateBrowserUI::startAnimation() {
  if (m_animating)
    return;

  m_animating = true;
  m_animation_thread = std::thread([this]() {
    while (m_animating) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      if (m_animating) {
        m_screen.RequestAnimationFrame();
      }
    }
  });
}

void DuplicateBrowserUI::stopAnimation() {
  m_animating = false;
  if (m_animation_thread.joinable()) {
    m_animation_thread.join();
  }

  // Redraw once more so the last spinner frame does not linger
  m_screen.RequestAnimationFrame();
}
