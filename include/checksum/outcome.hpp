#ifndef CSU_CHECKSUM_OUTCOME_HPP
#define CSU_CHECKSUM_OUTCOME_HPP

#include <filesystem>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace csu::checksum {

/**
 * Result of checking a data file against its sidecar:
 * Match          - sidecar equals the digest of the file content
 * NotMatch       - sidecar holds a different digest
 * NotFound       - no sidecar next to the file
 * Locked         - data file could not be opened due to permissions
 * CheckingFailed - any other I/O or hashing failure
 */
enum class VerificationStatus {
    Match,
    NotMatch,
    NotFound,
    Locked,
    CheckingFailed
};

/**
 * Result of generating a sidecar:
 * Created        - sidecar written
 * Existing       - sidecar already present, nothing read or written
 * LockedCreation - data file could not be opened due to permissions
 * Failed         - any other I/O or hashing failure
 */
enum class CreationStatus {
    Created,
    Existing,
    LockedCreation,
    Failed
};

const char* to_string(VerificationStatus status);
const char* to_string(CreationStatus status);

std::ostream& operator<<(std::ostream& os, VerificationStatus status);
std::ostream& operator<<(std::ostream& os, CreationStatus status);

// Only permission and generic failures carry an error message
bool carries_error(VerificationStatus status);
bool carries_error(CreationStatus status);

/**
 * Terminal classification of one candidate file by one operation.
 * The constructor rejects a status/error pairing that breaks the rule
 * above, so every stored outcome is consistent.
 */
template <typename Status>
class Outcome {
public:
    Outcome(std::filesystem::path path, Status status,
            std::optional<std::string> error = std::nullopt)
        : path_(std::move(path))
        , status_(status)
        , error_(std::move(error)) {
        if (carries_error(status_) != (error_.has_value() && !error_->empty())) {
            throw std::invalid_argument(std::string("Inconsistent error for status ") +
                                        to_string(status_));
        }
    }

    const std::filesystem::path& path() const { return path_; }
    Status status() const { return status_; }
    const std::optional<std::string>& error() const { return error_; }
    bool has_error() const { return error_.has_value(); }

private:
    std::filesystem::path path_;
    Status status_;
    std::optional<std::string> error_;
};

using VerificationOutcome = Outcome<VerificationStatus>;
using CreationOutcome = Outcome<CreationStatus>;

} // namespace csu::checksum

#endif // CSU_CHECKSUM_OUTCOME_HPP
