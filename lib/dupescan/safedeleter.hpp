#ifndef SAFEDELETER_HPP
#define SAFEDELETER_HPP

#include "scanpolicy.hpp"
#include <string>
#include <system_error>
#include <vector>

/**
 * @brief Guarded single-file deletion
 *
 * Every request is checked against the protected path fragments and
 * prefixes of the ScanPolicy before the filesystem is touched. Deletion is permanent (no
 * trash). The file may have changed or moved since the scan that produced
 * its path; no attempt is made to detect that unless removeVerified() is
 * used.
 */
class SafeDeleter {
public:
    enum class DeletionStatus {
        Deleted,
        BlockedProtectedPath,
        BlockedDirectory,
        BlockedSameFile,
        ContentMismatch,
        IoError
    };

    struct DeleteResult {
        DeletionStatus status;
        std::string message;

        bool ok() const { return status == DeletionStatus::Deleted; }
    };

    /**
     * @param policy Source of the protected fragments (copied and
     *               lowercased) and prefixes (copied)
     */
    explicit SafeDeleter(const ScanPolicy& policy);

    /**
     * @brief Check if the path contains a protected fragment (any case) or
     *        lies below a protected prefix
     */
    bool isProtectedPath(const std::string& path) const;

    /**
     * @brief Delete exactly one file
     * @return Deleted with "Deleted: <path>", or the reason it was refused
     *         or failed. The I/O reason is passed through unchanged.
     */
    DeleteResult remove(const std::string& path) const;

    /**
     * @brief Delete @p path only if it is byte-identical to @p keeper
     *
     * Both files are read in full. Refuses when the two paths name the same
     * file, since removing it would leave no copy behind.
     */
    DeleteResult removeVerified(const std::string& path,
                                const std::string& keeper) const;

    /**
     * @brief Full byte comparison of two files
     * @param ec Set if either file cannot be read
     */
    static bool filesIdentical(const std::string& a, const std::string& b,
                               std::error_code& ec);

    /**
     * @brief Get human-readable message for a refusal status
     */
    static std::string getStatusMessage(DeletionStatus status,
                                        const std::string& path);

private:
    std::vector<std::string> m_protectedFragments;
    std::vector<std::string> m_protectedPrefixes;
};

#endif // SAFEDELETER_HPP
