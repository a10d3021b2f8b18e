#ifndef CSU_CHECKSUM_CLASSIFIER_HPP
#define CSU_CHECKSUM_CLASSIFIER_HPP

#include <filesystem>
#include "checksum/outcome.hpp"

namespace csu::checksum {

// Compares the SHA-512 of data_path with its sidecar.
// The data file is opened before the sidecar is looked at, so an
// unreadable file reports Locked even when no sidecar exists.
// Never throws: every failure becomes an outcome
VerificationOutcome verify(const std::filesystem::path& data_path);

// Writes the sidecar for data_path unless one is already present.
// An existing sidecar short-circuits before the data file is opened.
// Never throws: every failure becomes an outcome
CreationOutcome create(const std::filesystem::path& data_path);

} // namespace csu::checksum

#endif // CSU_CHECKSUM_CLASSIFIER_HPP
