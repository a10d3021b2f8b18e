#include "io/input_file.hpp"
#include "digest/digest.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace csu {
namespace io {

bool is_permission_denied(const std::error_code& ec) {
  return ec == std::errc::permission_denied ||
         ec == std::errc::operation_not_permitted;
}

//==============================================
// DESCRIPTOR BUFFER
//==============================================

InputFile::DescriptorBuffer::DescriptorBuffer(int fd, const std::filesystem::path& path)
  : fd_(fd)
  , path_(path)
  , buffer_(digest::READ_BUFFER_SIZE) {
  setg(buffer_.data(), buffer_.data(), buffer_.data());
}

InputFile::DescriptorBuffer::int_type InputFile::DescriptorBuffer::underflow() {
  if (gptr() < egptr()) {
    return traits_type::to_int_type(*gptr());
  }

  ssize_t bytes_read;
  do {
    bytes_read = ::read(fd_, buffer_.data(), buffer_.size());
  } while (bytes_read < 0 && errno == EINTR);

  if (bytes_read < 0) {
    std::error_code ec(errno, std::generic_category());
    BOOST_LOG_TRIVIAL(error) << "Input file: Read failed for " << path_.string() << ": " << ec.message();
    throw std::filesystem::filesystem_error("Failed to read file", path_, ec);
  }

  if (bytes_read == 0) {
    return traits_type::eof();
  }

  setg(buffer_.data(), buffer_.data(), buffer_.data() + bytes_read);
  return traits_type::to_int_type(*gptr());
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

InputFile::InputFile(const std::filesystem::path& path)
  : path_(path)
  , fd_(open_descriptor(path))
  , buffer_(std::make_unique<DescriptorBuffer>(fd_, path_))
  , stream_(buffer_.get()) {
  // Surface the original filesystem_error instead of a bare badbit
  stream_.exceptions(std::ios::badbit);
  BOOST_LOG_TRIVIAL(trace) << "Input file: Opened " << path_.string();
}

InputFile::~InputFile() {
  close();
}

int InputFile::open_descriptor(const std::filesystem::path& path) {
  int fd;
  do {
    fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);

  if (fd < 0) {
    std::error_code ec(errno, std::generic_category());
    BOOST_LOG_TRIVIAL(debug) << "Input file: Failed to open " << path.string() << ": " << ec.message();
    throw std::filesystem::filesystem_error("Failed to open file", path, ec);
  }
  return fd;
}


//==============================================
// TEARDOWN
//==============================================

void InputFile::close() {
  if (fd_ < 0) {
    return;
  }
  if (::close(fd_) != 0) {
    BOOST_LOG_TRIVIAL(warning) << "Input file: Failed to close " << path_.string()
                               << ": " << std::error_code(errno, std::generic_category()).message();
  }
  fd_ = -1;
  BOOST_LOG_TRIVIAL(trace) << "Input file: Closed " << path_.string();
}

} // namespace io
} // namespace csu
