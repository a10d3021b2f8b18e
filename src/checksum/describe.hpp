#ifndef CSU_CHECKSUM_DESCRIBE_HPP
#define CSU_CHECKSUM_DESCRIBE_HPP

#include <exception>
#include <string>

namespace csu::checksum {

// Outcome errors must never be empty
inline std::string describe(const std::exception& e) {
  std::string message = e.what();
  return message.empty() ? std::string("unknown error") : message;
}

} // namespace csu::checksum

#endif // CSU_CHECKSUM_DESCRIBE_HPP
