#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <streambuf>
#include <system_error>
#include <vector>

namespace csu {
namespace io {

// True for the error codes an operator can fix by adjusting permissions
bool is_permission_denied(const std::error_code& ec);

// Read-only file handle exposed as an std::istream.
// Open and read failures are raised as std::filesystem::filesystem_error
// carrying the OS error code; the descriptor is closed on destruction
class InputFile {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit InputFile(const std::filesystem::path& path);
  ~InputFile();

  InputFile(const InputFile&) = delete;
  InputFile& operator=(const InputFile&) = delete;


  // ---- GETTERS ----
  std::istream& stream() { return stream_; }
  const std::filesystem::path& path() const { return path_; }
  bool is_open() const { return fd_ >= 0; }


  // ---- TEARDOWN ----
  void close();

private:
  // Streambuf pulling chunks straight from the descriptor
  class DescriptorBuffer : public std::streambuf {
  public:
    DescriptorBuffer(int fd, const std::filesystem::path& path);

  protected:
    int_type underflow() override;

  private:
    int fd_;
    const std::filesystem::path& path_;
    std::vector<char> buffer_;
  };

  // ---- PARAMETERS ----
  std::filesystem::path path_;
  int fd_;
  std::unique_ptr<DescriptorBuffer> buffer_;
  std::istream stream_;

  static int open_descriptor(const std::filesystem::path& path);
};

} // namespace io
} // namespace csu
