#include "checksum/classifier.hpp"
#include "describe.hpp"
#include "digest/digest.hpp"
#include "io/input_file.hpp"
#include "store/sidecar_store.hpp"
#include <memory>
#include <boost/log/trivial.hpp>

namespace csu::checksum {

VerificationOutcome verify(const std::filesystem::path& data_path) {
  BOOST_LOG_TRIVIAL(debug) << "Verifier: Checking " << data_path.string();

  std::unique_ptr<io::InputFile> file;
  try {
    file = std::make_unique<io::InputFile>(data_path);
  } catch (const std::filesystem::filesystem_error& e) {
    if (io::is_permission_denied(e.code())) {
      BOOST_LOG_TRIVIAL(warning) << "Verifier: Permission denied: " << data_path.string();
      return VerificationOutcome(data_path, VerificationStatus::Locked, describe(e));
    }
    BOOST_LOG_TRIVIAL(error) << "Verifier: Failed to open " << data_path.string() << ": " << e.what();
    return VerificationOutcome(data_path, VerificationStatus::CheckingFailed, describe(e));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Verifier: Failed to open " << data_path.string() << ": " << e.what();
    return VerificationOutcome(data_path, VerificationStatus::CheckingFailed, describe(e));
  }

  try {
    if (!store::sidecar_exists(data_path)) {
      BOOST_LOG_TRIVIAL(info) << "Verifier: No checksum file for " << data_path.string();
      return VerificationOutcome(data_path, VerificationStatus::NotFound);
    }

    const std::string actual = digest::to_hex(digest::compute_digest(file->stream()));
    file->close();

    const std::string expected = store::normalize_record(store::read_sidecar(data_path));

    // actual is lowercase hex and expected was lower-cased on read
    if (actual == expected) {
      BOOST_LOG_TRIVIAL(info) << "Verifier: Checksum matches for " << data_path.string();
      return VerificationOutcome(data_path, VerificationStatus::Match);
    }

    BOOST_LOG_TRIVIAL(warning) << "Verifier: Checksum mismatch for " << data_path.string()
                               << " (expected " << expected << ", got " << actual << ")";
    return VerificationOutcome(data_path, VerificationStatus::NotMatch);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Verifier: Checking failed for " << data_path.string() << ": " << e.what();
    return VerificationOutcome(data_path, VerificationStatus::CheckingFailed, describe(e));
  }
}

} // namespace csu::checksum
