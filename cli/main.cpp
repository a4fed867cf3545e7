#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "duplicatescanner.hpp"
#include "hashmode.hpp"
#include "scanpolicy.hpp"
#include "userdirs.hpp"
#include "utils.hpp"

/**
 * @class Application
 * @brief Command line front end for the duplicate scanner
 *
 * Runs one scan over the configured roots and prints the ranked groups,
 * then optionally deletes a single path or every redundant copy.
 *
 * Usage
 *  - dupescan-cli [-p DIR]... [-m MB | -b BYTES] [-d DEPTH]
 *                 [--mode sampled|full|sha256] [--delete PATH]
 *                 [--delete-all [--no-verify]] [-v]
 *
 * Output
 *  - Progress and results go to stdout; skipped paths (with -v) and
 *    refused deletes go to stderr.
 *
 * Thread-safety
 *  - Not thread-safe; intended to be the only user of the scanner.
 */
class Application {
public:
  struct Options {
    std::vector<std::filesystem::path> roots;
    std::uintmax_t minBytes = DuplicateScanner::megabytesToBytes(1.0);
    std::optional<int> depth;
    HashMode mode = HashMode::Sampled;
    std::string deletePath;
    bool deleteAll = false;
    bool verify = true;
    bool verbose = false;
  };

  int run(const Options &options) {
    ScanPolicy policy = ScanPolicy::defaults();
    if (options.depth) {
      policy.maxDepth = *options.depth;
    }

    auto hasher = makeHashCalculator(options.mode, policy);
    DuplicateScanner scanner(options.roots, *hasher, policy);

    if (!options.deletePath.empty()) {
      auto outcome = scanner.deleteFile(options.deletePath);
      if (!outcome.ok()) {
        std::cerr << outcome.message << std::endl;
        return 1;
      }
      std::cout << outcome.message << std::endl;
      return 0;
    }

    if (options.roots.empty()) {
      std::cerr << "No directories to scan." << std::endl;
      return 1;
    }

    std::cout << "Scan directories (" << hasher->name() << " fingerprint, "
              << "min " << formatBytes(options.minBytes) << "):" << std::endl;
    for (const auto &root : options.roots) {
      std::cout << "    " << root.string() << std::endl;
    }

    scanner.setProgressCallback([](int count) {
      std::cout << "\rFiles scanned: " << count << std::flush;
    });
    if (options.verbose) {
      scanner.setProblemCallback(
          [](const std::string &path, const std::string &reason) {
            std::cerr << "\nskipped: " << path << " (" << reason << ")"
                      << std::endl;
          });
    }

    ScanResult result = scanner.scan(options.minBytes);
    std::cout << std::endl;

    showGroups(result);
    showSummary(result);

    if (options.deleteAll) {
      deleteAll(scanner, result, options.verify);
    }

    return 0;
  }

private:
  void showGroups(const ScanResult &result) const {
    std::cout << "\n--- Duplicate groups ---" << std::endl;

    int groupNumber = 0;
    for (const auto &group : result.groups) {
      ++groupNumber;
      std::cout << "\n# DUPLICATE GROUP " << groupNumber
                << " (Fingerprint: " << group.fingerprint << ", "
                << group.count << " files of " << formatBytes(group.size)
                << ", " << formatBytes(group.wastedBytes) << " wasted)"
                << std::endl;

      for (const auto &file : group.files) {
        std::cout << "    -> " << file.path << "  [" << file.age;
        if (!file.extension.empty()) {
          std::cout << ", " << file.extension;
        }
        std::cout << "]" << std::endl;
      }
    }

    if (result.groups.empty()) {
      std::cout << "\nNo duplicate groups found." << std::endl;
    }
  }

  void showSummary(const ScanResult &result) const {
    std::cout << "\n--- Summary ---" << std::endl;
    std::cout << "Files scanned:    " << result.filesScanned << std::endl;
    std::cout << "Groups shown:     " << result.groups.size() << std::endl;
    std::cout << "Duplicate files:  " << result.totalDuplicates << std::endl;
    std::cout << "Wasted space:     " << formatBytes(result.totalWasted)
              << std::endl;
    std::cout << "Time taken:       " << std::fixed << std::setprecision(2)
              << result.elapsed.count() / 1000.0 << " seconds" << std::endl;
  }

  void deleteAll(const DuplicateScanner &scanner, const ScanResult &result,
                 bool verify) const {
    std::cout << "\n--- Deleting duplicates (keeping first of each group) ---"
              << std::endl;

    auto report = scanner.deleteAllDuplicates(result, verify);
    for (const auto &message : report.messages) {
      std::cout << "    " << message << std::endl;
    }

    std::cout << "Deleted " << report.deleted << " files, "
              << report.failed << " failed, "
              << formatBytes(report.reclaimedBytes) << " reclaimed."
              << std::endl;
  }
};

namespace {

void showUsage(const char *program) {
  std::cerr
      << "Usage: " << program << " [options]\n"
      << "  -p, --path DIR        Directory to scan (repeatable; default: "
         "Desktop, Documents, Downloads, Pictures, Videos, Music)\n"
      << "  -m, --min-size MB     Minimum file size in MB (default: 1)\n"
      << "  -b, --min-bytes N     Minimum file size in bytes\n"
      << "  -d, --depth N         Maximum directory depth (default: 4)\n"
      << "      --mode MODE       Fingerprint: sampled (default), full, "
         "sha256\n"
      << "      --delete PATH     Delete one file and exit\n"
      << "      --delete-all      Delete all but the first file of each "
         "group\n"
      << "      --no-verify       Trust the fingerprint; skip the full "
         "comparison --delete-all does before each delete\n"
      << "  -v, --verbose         Report skipped directories and files\n"
      << "  -h, --help            Show this help\n";
}

/** @brief Returns the next argument or nullptr if missing */
const char *nextArg(int argc, char *argv[], int &i) {
  if (i + 1 >= argc) {
    return nullptr;
  }
  return argv[++i];
}

} // namespace

int main(int argc, char *argv[]) {
  Application::Options options;
  bool customRoots = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      showUsage(argv[0]);
      return 0;
    }

    try {
      if (arg == "-p" || arg == "--path") {
        const char *value = nextArg(argc, argv, i);
        if (!value)
          throw std::invalid_argument("missing directory");
        options.roots.emplace_back(value);
        customRoots = true;
      } else if (arg == "-m" || arg == "--min-size") {
        const char *value = nextArg(argc, argv, i);
        if (!value)
          throw std::invalid_argument("missing size");
        options.minBytes = DuplicateScanner::megabytesToBytes(std::stod(value));
      } else if (arg == "-b" || arg == "--min-bytes") {
        const char *value = nextArg(argc, argv, i);
        if (!value)
          throw std::invalid_argument("missing size");
        auto bytes = parseByteCount(value);
        if (!bytes)
          throw std::invalid_argument("not a byte count");
        options.minBytes = *bytes;
      } else if (arg == "-d" || arg == "--depth") {
        const char *value = nextArg(argc, argv, i);
        if (!value)
          throw std::invalid_argument("missing depth");
        options.depth = std::stoi(value);
        if (*options.depth < 0)
          throw std::invalid_argument("negative depth");
      } else if (arg == "--mode") {
        const char *value = nextArg(argc, argv, i);
        auto mode = value ? parseHashMode(value) : std::nullopt;
        if (!mode)
          throw std::invalid_argument("unknown fingerprint mode");
        options.mode = *mode;
      } else if (arg == "--delete") {
        const char *value = nextArg(argc, argv, i);
        if (!value)
          throw std::invalid_argument("missing path");
        options.deletePath = value;
      } else if (arg == "--delete-all") {
        options.deleteAll = true;
      } else if (arg == "--verify") {
        options.verify = true;
      } else if (arg == "--no-verify") {
        options.verify = false;
      } else if (arg == "-v" || arg == "--verbose") {
        options.verbose = true;
      } else {
        throw std::invalid_argument("unknown option");
      }
    } catch (const std::exception &e) {
      std::cerr << "Invalid argument '" << arg << "': " << e.what()
                << std::endl;
      showUsage(argv[0]);
      return 1;
    }
  }

  if (!customRoots) {
    options.roots = wellKnownUserDirectories();
  }

  try {
    Application app;
    return app.run(options);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
