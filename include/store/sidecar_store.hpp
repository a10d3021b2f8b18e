#pragma once

#include <filesystem>
#include <string>
#include "checksum/checksum_error.hpp"

namespace csu {
namespace store {

// Suffix tying a data file to the SHA-512 record stored beside it
static constexpr const char* SIDECAR_SUFFIX = ".sha512";
// Records are staged under <sidecar>.<pid>.partial before being linked in place
static constexpr const char* STAGING_SUFFIX = ".partial";


// ---- PATH DERIVATION ----
// <data_path>.sha512
std::filesystem::path sidecar_path(const std::filesystem::path& data_path);
// Checks if path itself names a sidecar (suffix match, case-sensitive)
bool is_sidecar(const std::filesystem::path& path);


// ---- QUERY OPERATIONS ----
// False only when the sidecar does not exist; any other stat failure
// throws std::filesystem::filesystem_error
bool sidecar_exists(const std::filesystem::path& data_path);
// Returns the raw sidecar content
std::string read_sidecar(const std::filesystem::path& data_path);
// Trims surrounding whitespace and lower-cases a sidecar record
std::string normalize_record(const std::string& record);


// ---- CORE STORAGE OPERATIONS ----
std::filesystem::path staging_path(const std::filesystem::path& data_path);
// Creates the sidecar holding exactly digest_hex. Never overwrites:
// returns false when a sidecar is already present. The record is staged
// and hard-linked into place, so the sidecar name never points at a
// partial record; filesystems without hard links fall back to an
// exclusive direct write
bool write_sidecar_if_absent(const std::filesystem::path& data_path, const std::string& digest_hex);

} // namespace store
} // namespace csu
