#pragma once

#include <filesystem>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace csu {
namespace traversal {

// Receives every traversal-level error message as it is found
using ErrorSink = std::function<void(const std::string&)>;


// ---- INPUT EXPANSION ----
// Checks for '*', '?' or '['
bool has_glob_meta(const std::string& arg);
// Expands glob patterns with glob(3); literal arguments pass through unchanged
std::vector<std::string> expand_args(const std::vector<std::string>& args, const ErrorSink& on_error);
// Reads a newline-delimited path list; blank lines and sidecar paths are dropped
std::vector<std::string> read_path_list(std::istream& input, const ErrorSink& on_error);
// Expanded arguments followed by the piped-in path list when input is not a terminal
std::vector<std::string> gather_roots(const std::vector<std::string>& args, std::istream& input,
                                      bool input_is_tty, const ErrorSink& on_error);


// ---- CANDIDATE COLLECTION ----
// Reports roots that cannot be stat'ed; true when the root exists
bool stat_root(const std::string& root, const ErrorSink& on_error);
// Candidate files for one root argument, sorted by path.
// Returns nullopt when the root itself is rejected (missing, a sidecar,
// or not a regular file)
std::optional<std::vector<std::filesystem::path>> collect_candidates(const std::string& root,
                                                                     const ErrorSink& on_error);
// Absolute, lexically normalized form without a trailing separator
std::filesystem::path absolute_path(const std::filesystem::path& path);

} // namespace traversal
} // namespace csu
