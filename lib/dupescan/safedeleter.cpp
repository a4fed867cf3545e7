/**
 * @file safedeleter.cpp
 * @brief Implementation of guarded file deletion
 *
 * This file implements the protected-location check that stands in front of
 * every delete request, the delete itself, and the optional full-content
 * comparison used by verify mode.
 */

#include "safedeleter.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return text;
}

} // namespace

SafeDeleter::SafeDeleter(const ScanPolicy& policy) {
    m_protectedFragments.reserve(policy.protectedPathFragments.size());
    for (const auto& fragment : policy.protectedPathFragments) {
        if (!fragment.empty()) {
            m_protectedFragments.push_back(toLower(fragment));
        }
    }

    for (const auto& prefix : policy.protectedPathPrefixes) {
        if (!prefix.empty()) {
            m_protectedPrefixes.push_back(prefix);
        }
    }
}

/**
 * @brief Checks a path against the protected fragments and prefixes
 *
 * Fragments are a case-insensitive substring match on the path as given,
 * so "C:\\Windows\\notepad.exe" is caught wherever the tree sits.
 * Prefixes are matched against the start of the absolute, lexically
 * normalized path, so "/usr/bin/ls" and "/home/../usr/bin/ls" are caught
 * while a user folder that happens to be named "bin" is not.
 *
 * @param path The filesystem path to check
 * @return true if a fragment occurs in the path or a prefix starts it
 */
bool SafeDeleter::isProtectedPath(const std::string& path) const {
    const std::string lower = toLower(path);
    for (const auto& fragment : m_protectedFragments) {
        if (lower.find(fragment) != std::string::npos) {
            return true;
        }
    }

    if (m_protectedPrefixes.empty()) {
        return false;
    }

    fs::path target(path);
    if (target.is_relative()) {
        std::error_code ec;
        fs::path absolute = fs::absolute(target, ec);
        if (!ec) {
            target = absolute;
        }
    }
    const std::string normalized = target.lexically_normal().generic_string();

    for (const auto& prefix : m_protectedPrefixes) {
        if (normalized.compare(0, prefix.size(), prefix) == 0) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Deletes a single file after the safety checks
 *
 * Checks, in order:
 * 1. Protected location (no filesystem access at all)
 * 2. Existence, via symlink_status (links are removed, not followed)
 * 3. Directories are refused
 *
 * @param path The file to delete
 * @return DeleteResult describing the outcome
 */
SafeDeleter::DeleteResult SafeDeleter::remove(const std::string& path) const {
    if (isProtectedPath(path)) {
        return {DeletionStatus::BlockedProtectedPath,
                getStatusMessage(DeletionStatus::BlockedProtectedPath, path)};
    }

    std::error_code ec;
    const fs::file_status status = fs::symlink_status(path, ec);
    if (ec) {
        return {DeletionStatus::IoError, "Failed to delete: " + ec.message()};
    }

    if (fs::is_directory(status)) {
        return {DeletionStatus::BlockedDirectory,
                getStatusMessage(DeletionStatus::BlockedDirectory, path)};
    }

    const bool removed = fs::remove(path, ec);
    if (ec) {
        return {DeletionStatus::IoError, "Failed to delete: " + ec.message()};
    }
    if (!removed) {
        // Vanished between the status check and the remove
        const std::error_code gone =
            std::make_error_code(std::errc::no_such_file_or_directory);
        return {DeletionStatus::IoError, "Failed to delete: " + gone.message()};
    }

    return {DeletionStatus::Deleted, "Deleted: " + path};
}

SafeDeleter::DeleteResult
SafeDeleter::removeVerified(const std::string& path,
                            const std::string& keeper) const {
    if (isProtectedPath(path)) {
        return {DeletionStatus::BlockedProtectedPath,
                getStatusMessage(DeletionStatus::BlockedProtectedPath, path)};
    }

    std::error_code ec;
    if (fs::equivalent(path, keeper, ec)) {
        return {DeletionStatus::BlockedSameFile,
                getStatusMessage(DeletionStatus::BlockedSameFile, path)};
    }
    if (ec) {
        return {DeletionStatus::IoError, "Failed to delete: " + ec.message()};
    }

    const bool identical = filesIdentical(path, keeper, ec);
    if (ec) {
        return {DeletionStatus::IoError, "Failed to delete: " + ec.message()};
    }
    if (!identical) {
        return {DeletionStatus::ContentMismatch,
                getStatusMessage(DeletionStatus::ContentMismatch, path) +
                    " (kept copy: " + keeper + ")"};
    }

    return remove(path);
}

/**
 * @brief Compares two files byte by byte
 *
 * Sizes are compared first; equal sizes are then streamed in 64 KiB blocks.
 */
bool SafeDeleter::filesIdentical(const std::string& a, const std::string& b,
                                 std::error_code& ec) {
    ec.clear();

    const std::uintmax_t sizeA = fs::file_size(a, ec);
    if (ec) {
        return false;
    }
    const std::uintmax_t sizeB = fs::file_size(b, ec);
    if (ec) {
        return false;
    }
    if (sizeA != sizeB) {
        return false;
    }

    std::ifstream fileA(a, std::ios::binary);
    std::ifstream fileB(b, std::ios::binary);
    if (!fileA || !fileB) {
        ec = std::make_error_code(std::errc::permission_denied);
        return false;
    }

    std::vector<char> bufA(64 * 1024);
    std::vector<char> bufB(64 * 1024);
    while (fileA && fileB) {
        fileA.read(bufA.data(), static_cast<std::streamsize>(bufA.size()));
        fileB.read(bufB.data(), static_cast<std::streamsize>(bufB.size()));
        const std::streamsize gotA = fileA.gcount();
        if (gotA != fileB.gcount()) {
            return false;
        }
        if (!std::equal(bufA.begin(), bufA.begin() + gotA, bufB.begin())) {
            return false;
        }
    }

    if (fileA.bad() || fileB.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return false;
    }
    return true;
}

std::string SafeDeleter::getStatusMessage(DeletionStatus status,
                                          const std::string& path) {
    switch (status) {
        case DeletionStatus::Deleted:
            return "Deleted: " + path;
        case DeletionStatus::BlockedProtectedPath:
            return "Cannot delete files from system directories: " + path;
        case DeletionStatus::BlockedDirectory:
            return "Cannot delete a directory: " + path;
        case DeletionStatus::BlockedSameFile:
            return "Refusing to delete the kept copy itself: " + path;
        case DeletionStatus::ContentMismatch:
            return "Contents differ, not deleted: " + path;
        case DeletionStatus::IoError:
            return "Failed to delete: " + path;
        default:
            return "Unknown status";
    }
}
