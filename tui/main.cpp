#include "duplicatebrowserui.hpp"
#include "hashmode.hpp"
#include "userdirs.hpp"

#include <iostream>
#include <stdexcept>

namespace {

void showUsage(const char *program) {
  std::cerr << "Usage: " << program
            << " [-p DIR]... [-m MB] [--mode sampled|full|sha256] [--no-verify]\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::vector<std::filesystem::path> roots;
  double minMegabytes = 1.0;
  HashMode mode = HashMode::Sampled;
  bool verify = true;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    try {
      if ((arg == "-p" || arg == "--path") && i + 1 < argc) {
        roots.emplace_back(argv[++i]);
      } else if ((arg == "-m" || arg == "--min-size") && i + 1 < argc) {
        minMegabytes = std::stod(argv[++i]);
      } else if (arg == "--mode" && i + 1 < argc) {
        auto parsed = parseHashMode(argv[++i]);
        if (!parsed)
          throw std::invalid_argument("unknown fingerprint mode");
        mode = *parsed;
      } else if (arg == "--verify") {
        verify = true;
      } else if (arg == "--no-verify") {
        verify = false;
      } else {
        showUsage(argv[0]);
        return arg == "-h" || arg == "--help" ? 0 : 1;
      }
    } catch (const std::exception &e) {
      std::cerr << "Invalid argument '" << arg << "': " << e.what()
                << std::endl;
      return 1;
    }
  }

  if (roots.empty()) {
    roots = wellKnownUserDirectories();
  }

  try {
    ScanPolicy policy = ScanPolicy::defaults();
    DuplicateBrowserUI ui(std::move(roots),
                          DuplicateScanner::megabytesToBytes(minMegabytes),
                          makeHashCalculator(mode, policy), policy, verify);
    ui.initialize();
    ui.run();
  } catch (const std::exception &e) {
    // Terminal is restored by the time the exception arrives here
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
