#include "store/sidecar_store.hpp"
#include "io/input_file.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <vector>
#include <boost/log/trivial.hpp>

namespace csu {
namespace store {

using checksum::SidecarError;

namespace {

std::error_code last_error() {
  return std::error_code(errno, std::generic_category());
}

// Best effort: the caller is already reporting the first failure
void discard_partial(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "Sidecar store: Failed to remove "
                               << path.string() << ": " << ec.message();
  }
}

// Filesystems such as FAT refuse link(2)
bool supports_hard_links(int link_errno) {
  return link_errno != EPERM && link_errno != EOPNOTSUPP && link_errno != ENOSYS &&
         link_errno != EMLINK;
}

// Creates path with content. With O_EXCL an existing file is left alone and
// false is returned; a failed write removes what was written before throwing
bool write_file(const std::filesystem::path& path, const std::string& content, int extra_flags) {
  int fd;
  do {
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC | extra_flags, 0644);
  } while (fd < 0 && errno == EINTR);

  if (fd < 0) {
    if (errno == EEXIST && (extra_flags & O_EXCL)) {
      return false;
    }
    std::error_code ec = last_error();
    BOOST_LOG_TRIVIAL(error) << "Sidecar store: Failed to create " << path.string() << ": " << ec.message();
    throw std::filesystem::filesystem_error("Failed to create checksum file", path, ec);
  }

  const char* data = content.data();
  size_t remaining = content.size();

  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0 && errno == EINTR) {
      continue;
    }
    if (written < 0) {
      std::error_code ec = last_error();
      ::close(fd);
      discard_partial(path);
      BOOST_LOG_TRIVIAL(error) << "Sidecar store: Failed to write " << path.string() << ": " << ec.message();
      throw std::filesystem::filesystem_error("Failed to write checksum file", path, ec);
    }
    if (written == 0) {
      ::close(fd);
      discard_partial(path);
      throw SidecarError("No progress writing " + path.string());
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }

  if (::close(fd) != 0) {
    std::error_code ec = last_error();
    discard_partial(path);
    BOOST_LOG_TRIVIAL(error) << "Sidecar store: Failed to close " << path.string() << ": " << ec.message();
    throw std::filesystem::filesystem_error("Failed to close checksum file", path, ec);
  }
  return true;
}

} // namespace

//==============================================
// PATH DERIVATION
//==============================================

std::filesystem::path sidecar_path(const std::filesystem::path& data_path) {
  std::filesystem::path path = data_path;
  path += SIDECAR_SUFFIX;
  return path;
}

bool is_sidecar(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  const std::string suffix = SIDECAR_SUFFIX;
  return name.size() >= suffix.size() &&
         name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool sidecar_exists(const std::filesystem::path& data_path) {
  std::filesystem::path path = sidecar_path(data_path);
  BOOST_LOG_TRIVIAL(debug) << "Sidecar store: Checking existence of " << path.string();

  std::error_code ec;
  std::filesystem::file_status status = std::filesystem::status(path, ec);

  if (status.type() == std::filesystem::file_type::not_found) {
    BOOST_LOG_TRIVIAL(debug) << "Sidecar store: Sidecar not found: " << path.string();
    return false;
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Sidecar store: Failed to stat " << path.string() << ": " << ec.message();
    throw std::filesystem::filesystem_error("Failed to stat checksum file", path, ec);
  }
  return true;
}

std::string read_sidecar(const std::filesystem::path& data_path) {
  std::filesystem::path path = sidecar_path(data_path);
  BOOST_LOG_TRIVIAL(debug) << "Sidecar store: Reading " << path.string();

  io::InputFile file(path);
  std::istream& input = file.stream();

  std::string content;
  char buffer[4096];

  // Read file in chunks
  while (input.read(buffer, sizeof(buffer))) {
    content.append(buffer, input.gcount());
  }

  // Handle final partial chunk if any
  if (input.gcount() > 0) {
    content.append(buffer, input.gcount());
  }

  BOOST_LOG_TRIVIAL(debug) << "Sidecar store: Read " << content.size() << " bytes from " << path.string();
  return content;
}

std::string normalize_record(const std::string& record) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

  auto first = std::find_if_not(record.begin(), record.end(), is_space);
  auto last = std::find_if_not(record.rbegin(), record.rend(), is_space).base();
  if (first >= last) {
    return std::string();
  }

  std::string normalized(first, last);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return normalized;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::filesystem::path staging_path(const std::filesystem::path& data_path) {
  std::filesystem::path path = sidecar_path(data_path);
  path += "." + std::to_string(::getpid()) + STAGING_SUFFIX;
  return path;
}

bool write_sidecar_if_absent(const std::filesystem::path& data_path, const std::string& digest_hex) {
  std::filesystem::path path = sidecar_path(data_path);
  BOOST_LOG_TRIVIAL(info) << "Sidecar store: Writing " << path.string();

  if (digest_hex.empty()) {
    throw SidecarError("Refusing to write an empty record to " + path.string());
  }

  // The record is complete on disk before the sidecar name appears
  std::filesystem::path staging = staging_path(data_path);
  write_file(staging, digest_hex, O_TRUNC);

  bool published = true;
  if (::link(staging.c_str(), path.c_str()) != 0) {
    const int link_errno = errno;
    discard_partial(staging);

    if (link_errno == EEXIST) {
      BOOST_LOG_TRIVIAL(info) << "Sidecar store: Sidecar already exists, leaving it untouched: " << path.string();
      return false;
    }
    if (!supports_hard_links(link_errno)) {
      std::error_code ec(link_errno, std::generic_category());
      BOOST_LOG_TRIVIAL(error) << "Sidecar store: Failed to publish " << path.string() << ": " << ec.message();
      throw std::filesystem::filesystem_error("Failed to create checksum file", path, ec);
    }

    BOOST_LOG_TRIVIAL(debug) << "Sidecar store: No hard links on this filesystem, writing " << path.string() << " directly";
    published = write_file(path, digest_hex, O_EXCL);
  } else {
    discard_partial(staging);
  }

  if (!published) {
    BOOST_LOG_TRIVIAL(info) << "Sidecar store: Sidecar already exists, leaving it untouched: " << path.string();
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "Sidecar store: Successfully wrote " << digest_hex.size() << " bytes to " << path.string();
  return true;
}

} // namespace store
} // namespace csu
