#include "rankingpresenter.hpp"
#include <algorithm>

namespace fs = std::filesystem;

ScanResult RankingPresenter::present(std::vector<DuplicateGroup> groups,
                                     std::size_t filesScanned,
                                     std::chrono::milliseconds elapsed,
                                     fs::file_time_type now) const {
  ScanResult result;
  result.filesScanned = filesScanned;
  result.elapsed = elapsed;

  // Totals first: the display cap must not shrink them
  result.totalDuplicates = DuplicateGrouper::countDuplicates(groups);
  result.totalWasted = DuplicateGrouper::calculateWastedSpace(groups);

  std::stable_sort(groups.begin(), groups.end(),
                   [](const DuplicateGroup &a, const DuplicateGroup &b) {
                     return a.wastedBytes() > b.wastedBytes();
                   });

  const std::size_t shown = std::min(groups.size(), m_maxGroups);
  result.groups.reserve(shown);

  for (std::size_t i = 0; i < shown; ++i) {
    const DuplicateGroup &group = groups[i];

    PresentedGroup presented;
    presented.fingerprint = displayFingerprint(group.fingerprint);
    presented.size = group.size;
    presented.count = group.count();
    presented.wastedBytes = group.wastedBytes();
    presented.files.reserve(group.files.size());
    for (const auto &record : group.files) {
      presented.files.push_back(presentFile(record, now));
    }

    result.groups.push_back(std::move(presented));
  }

  return result;
}

std::string
RankingPresenter::ageLabel(const std::optional<fs::file_time_type> &modified,
                           fs::file_time_type now) {
  if (!modified) {
    return "unknown";
  }
  if (*modified >= now) {
    return "today";
  }

  using Days = std::chrono::duration<long long, std::ratio<86400>>;
  const long long days = std::chrono::duration_cast<Days>(now - *modified).count();

  if (days < 1) {
    return "today";
  }
  if (days < 30) {
    return std::to_string(days) + "d ago";
  }
  if (days < 365) {
    return std::to_string(days / 30) + "mo ago";
  }
  return std::to_string(days / 365) + "y ago";
}

std::string RankingPresenter::displayFingerprint(const std::string &fingerprint) {
  return fingerprint.substr(0, 16);
}

FilePresentation RankingPresenter::presentFile(const FileRecord &record,
                                               fs::file_time_type now) {
  FilePresentation file;
  file.path = record.getPath();
  file.size = record.getFileSize();
  file.age = ageLabel(record.getModified(), now);
  file.extension = record.getExtension();
  return file;
}
