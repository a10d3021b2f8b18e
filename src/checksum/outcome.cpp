#include "checksum/outcome.hpp"

namespace csu::checksum {

const char* to_string(VerificationStatus status) {
  switch (status) {
    case VerificationStatus::Match:          return "Match";
    case VerificationStatus::NotMatch:       return "NotMatch";
    case VerificationStatus::NotFound:       return "NotFound";
    case VerificationStatus::Locked:         return "Locked";
    case VerificationStatus::CheckingFailed: return "CheckingFailed";
    default:                                 return "UNKNOWN";
  }
}

const char* to_string(CreationStatus status) {
  switch (status) {
    case CreationStatus::Created:        return "Created";
    case CreationStatus::Existing:       return "Existing";
    case CreationStatus::LockedCreation: return "LockedCreation";
    case CreationStatus::Failed:         return "Failed";
    default:                             return "UNKNOWN";
  }
}

std::ostream& operator<<(std::ostream& os, VerificationStatus status) {
  return os << to_string(status);
}

std::ostream& operator<<(std::ostream& os, CreationStatus status) {
  return os << to_string(status);
}

bool carries_error(VerificationStatus status) {
  return status == VerificationStatus::Locked ||
         status == VerificationStatus::CheckingFailed;
}

bool carries_error(CreationStatus status) {
  return status == CreationStatus::LockedCreation ||
         status == CreationStatus::Failed;
}

} // namespace csu::checksum
