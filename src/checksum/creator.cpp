#include "checksum/classifier.hpp"
#include "describe.hpp"
#include "digest/digest.hpp"
#include "io/input_file.hpp"
#include "store/sidecar_store.hpp"
#include <memory>
#include <boost/log/trivial.hpp>

namespace csu::checksum {

CreationOutcome create(const std::filesystem::path& data_path) {
  BOOST_LOG_TRIVIAL(debug) << "Creator: Creating checksum file for " << data_path.string();

  // An existing sidecar is accepted as-is; the data file is not touched
  try {
    if (store::sidecar_exists(data_path)) {
      BOOST_LOG_TRIVIAL(info) << "Creator: Checksum file already exists for " << data_path.string();
      return CreationOutcome(data_path, CreationStatus::Existing);
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Creator: Failed to check checksum file for " << data_path.string() << ": " << e.what();
    return CreationOutcome(data_path, CreationStatus::Failed, describe(e));
  }

  std::unique_ptr<io::InputFile> file;
  try {
    file = std::make_unique<io::InputFile>(data_path);
  } catch (const std::filesystem::filesystem_error& e) {
    if (io::is_permission_denied(e.code())) {
      BOOST_LOG_TRIVIAL(warning) << "Creator: Permission denied: " << data_path.string();
      return CreationOutcome(data_path, CreationStatus::LockedCreation, describe(e));
    }
    BOOST_LOG_TRIVIAL(error) << "Creator: Failed to open " << data_path.string() << ": " << e.what();
    return CreationOutcome(data_path, CreationStatus::Failed, describe(e));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Creator: Failed to open " << data_path.string() << ": " << e.what();
    return CreationOutcome(data_path, CreationStatus::Failed, describe(e));
  }

  try {
    const std::string hex = digest::to_hex(digest::compute_digest(file->stream()));
    file->close();

    if (!store::write_sidecar_if_absent(data_path, hex)) {
      // Another writer created the sidecar while we were hashing
      return CreationOutcome(data_path, CreationStatus::Existing);
    }

    BOOST_LOG_TRIVIAL(info) << "Creator: Created checksum file for " << data_path.string();
    return CreationOutcome(data_path, CreationStatus::Created);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Creator: Failed for " << data_path.string() << ": " << e.what();
    return CreationOutcome(data_path, CreationStatus::Failed, describe(e));
  }
}

} // namespace csu::checksum
