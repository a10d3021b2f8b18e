#include "traversal/traversal.hpp"
#include "store/sidecar_store.hpp"
#include <algorithm>
#include <cctype>
#include <glob.h>
#include <boost/log/trivial.hpp>

namespace csu {
namespace traversal {

namespace fs = std::filesystem;

namespace {

std::string format_error(const fs::path& path, const std::error_code& ec) {
  return path.string() + ": " + ec.message();
}

std::string trim(const std::string& line) {
  auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto first = std::find_if_not(line.begin(), line.end(), is_space);
  auto last = std::find_if_not(line.rbegin(), line.rend(), is_space).base();
  return first < last ? std::string(first, last) : std::string();
}

// Releases glob(3) results on every exit path
struct GlobResult {
  glob_t matches{};
  ~GlobResult() { globfree(&matches); }
};

void walk_directory(const fs::path& directory, std::vector<fs::path>& candidates,
                    const ErrorSink& on_error) {
  BOOST_LOG_TRIVIAL(trace) << "Traversal: Entering " << directory.string();

  std::error_code ec;
  fs::directory_iterator it(directory, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Traversal: Cannot open directory " << directory.string() << ": " << ec.message();
    on_error(format_error(directory, ec));
    return;
  }

  const fs::directory_iterator end;
  while (it != end) {
    const fs::path path = it->path();

    std::error_code link_ec;
    const bool is_link = it->is_symlink(link_ec);
    std::error_code status_ec;
    const fs::file_status status = it->status(status_ec);

    if (link_ec) {
      // Without the link type a directory symlink could be followed
      BOOST_LOG_TRIVIAL(error) << "Traversal: Cannot lstat " << path.string() << ": " << link_ec.message();
      on_error(format_error(path, link_ec));
    } else if (status_ec) {
      BOOST_LOG_TRIVIAL(error) << "Traversal: Cannot stat " << path.string() << ": " << status_ec.message();
      on_error(format_error(path, status_ec));
    } else if (fs::is_directory(status)) {
      if (is_link) {
        BOOST_LOG_TRIVIAL(debug) << "Traversal: Not following directory symlink " << path.string();
      } else {
        walk_directory(path, candidates, on_error);
      }
    } else if (fs::is_regular_file(status)) {
      if (store::is_sidecar(path)) {
        BOOST_LOG_TRIVIAL(trace) << "Traversal: Skipping checksum file " << path.string();
      } else {
        candidates.push_back(path);
      }
    } else {
      BOOST_LOG_TRIVIAL(debug) << "Traversal: Skipping non-regular file " << path.string();
    }

    it.increment(ec);
    if (ec) {
      // The iterator is unusable after a failed increment; only this subtree is lost
      BOOST_LOG_TRIVIAL(error) << "Traversal: Walk aborted in " << directory.string() << ": " << ec.message();
      on_error(format_error(directory, ec));
      return;
    }
  }
}

} // namespace

//==============================================
// INPUT EXPANSION
//==============================================

bool has_glob_meta(const std::string& arg) {
  return arg.find_first_of("*?[") != std::string::npos;
}

std::vector<std::string> expand_args(const std::vector<std::string>& args, const ErrorSink& on_error) {
  std::vector<std::string> expanded;

  for (const auto& arg : args) {
    if (!has_glob_meta(arg)) {
      expanded.push_back(arg);
      continue;
    }

    BOOST_LOG_TRIVIAL(debug) << "Traversal: Expanding pattern " << arg;
    GlobResult result;
    int rc = ::glob(arg.c_str(), 0, nullptr, &result.matches);

    if (rc == GLOB_NOMATCH) {
      BOOST_LOG_TRIVIAL(warning) << "Traversal: No matches for " << arg;
      on_error("no matches for \"" + arg + "\"");
      continue;
    }
    if (rc != 0) {
      const char* reason = rc == GLOB_NOSPACE ? "out of memory" : "read error";
      BOOST_LOG_TRIVIAL(error) << "Traversal: Failed to expand " << arg << ": " << reason;
      on_error("failed to expand \"" + arg + "\": " + reason);
      continue;
    }

    for (size_t i = 0; i < result.matches.gl_pathc; ++i) {
      expanded.emplace_back(result.matches.gl_pathv[i]);
    }
    BOOST_LOG_TRIVIAL(debug) << "Traversal: Pattern " << arg << " matched " << result.matches.gl_pathc << " paths";
  }

  return expanded;
}

std::vector<std::string> read_path_list(std::istream& input, const ErrorSink& on_error) {
  std::vector<std::string> paths;
  std::string line;

  while (std::getline(input, line)) {
    std::string path = trim(line);
    if (path.empty() || store::is_sidecar(path)) {
      continue;
    }
    paths.push_back(path);
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Traversal: Failed reading path list";
    on_error("failed to read path list from standard input");
  }

  BOOST_LOG_TRIVIAL(debug) << "Traversal: Read " << paths.size() << " paths from path list";
  return paths;
}

std::vector<std::string> gather_roots(const std::vector<std::string>& args, std::istream& input,
                                      bool input_is_tty, const ErrorSink& on_error) {
  std::vector<std::string> roots = expand_args(args, on_error);

  if (!input_is_tty) {
    std::vector<std::string> listed = read_path_list(input, on_error);
    roots.insert(roots.end(), listed.begin(), listed.end());
  }

  return roots;
}


//==============================================
// CANDIDATE COLLECTION
//==============================================

bool stat_root(const std::string& root, const ErrorSink& on_error) {
  std::error_code ec;
  fs::status(root, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Traversal: Cannot stat " << root << ": " << ec.message();
    on_error(format_error(root, ec));
    return false;
  }
  return true;
}

fs::path absolute_path(const fs::path& path) {
  fs::path result = fs::absolute(path).lexically_normal();
  if (!result.has_filename() && result.has_relative_path()) {
    result = result.parent_path();
  }
  return result;
}

std::optional<std::vector<fs::path>> collect_candidates(const std::string& root,
                                                        const ErrorSink& on_error) {
  std::error_code ec;
  const fs::file_status status = fs::status(root, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Traversal: Cannot stat " << root << ": " << ec.message();
    on_error(format_error(root, ec));
    return std::nullopt;
  }

  fs::path root_path;
  try {
    root_path = absolute_path(root);
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Traversal: Cannot resolve " << root << ": " << e.what();
    on_error(format_error(root, e.code()));
    return std::nullopt;
  }

  std::vector<fs::path> candidates;

  if (fs::is_directory(status)) {
    BOOST_LOG_TRIVIAL(info) << "Traversal: Walking " << root_path.string();
    walk_directory(root_path, candidates, on_error);
    std::sort(candidates.begin(), candidates.end());
  } else if (store::is_sidecar(root_path)) {
    BOOST_LOG_TRIVIAL(warning) << "Traversal: Rejecting checksum file argument " << root_path.string();
    on_error(root_path.string() + " is a checksum file.");
    return std::nullopt;
  } else if (!fs::is_regular_file(status)) {
    // FIFOs and devices would block or never reach end of file
    BOOST_LOG_TRIVIAL(warning) << "Traversal: Rejecting non-regular file argument " << root_path.string();
    on_error(root_path.string() + " is not a regular file");
    return std::nullopt;
  } else {
    candidates.push_back(root_path);
  }

  BOOST_LOG_TRIVIAL(info) << "Traversal: " << candidates.size() << " candidate files under " << root_path.string();
  return candidates;
}

} // namespace traversal
} // namespace csu
