#ifndef CSU_CHECKSUM_ERROR_HPP
#define CSU_CHECKSUM_ERROR_HPP

#include <stdexcept>
#include <string>

namespace csu::checksum {

class ChecksumError : public std::runtime_error {
public:
    explicit ChecksumError(const std::string& message) 
        : std::runtime_error(message) {}
};

class DigestError : public ChecksumError {
public:
    explicit DigestError(const std::string& message) 
        : ChecksumError("Digest error: " + message) {}
};

class SidecarError : public ChecksumError {
public:
    explicit SidecarError(const std::string& message) 
        : ChecksumError("Sidecar error: " + message) {}
};

} // namespace csu::checksum

#endif // CSU_CHECKSUM_ERROR_HPP
