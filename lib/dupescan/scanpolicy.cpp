#include "scanpolicy.hpp"

ScanPolicy ScanPolicy::defaults() {
  ScanPolicy policy;

  policy.excludedDirectoryNames = {".git", ".svn", ".hg", "node_modules",
                                   "AppData"};

  // Windows: OS directory, program installation, system binaries
  policy.protectedPathFragments = {"\\windows\\", "\\program files",
                                   "\\system32"};

  policy.protectedPathPrefixes = {"/etc/", "/boot/", "/usr/",
                                  "/opt/", "/bin/", "/sbin/"};

  return policy;
}

bool ScanPolicy::isExcludedDirectory(const std::string &name) const {
  if (skipHiddenDirectories && !name.empty() && name[0] == '.')
    return true;
  return excludedDirectoryNames.count(name) > 0;
}
