#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "checksum/outcome.hpp"

namespace csu {
namespace engine {

struct VerificationSummary {
  size_t total{0};
  size_t matched{0};
  std::vector<checksum::VerificationOutcome> not_matched;
  std::vector<checksum::VerificationOutcome> not_found;
  std::vector<checksum::VerificationOutcome> locked;
  std::vector<checksum::VerificationOutcome> failed;
};

struct CreationSummary {
  size_t total{0};
  size_t created{0};
  std::vector<checksum::CreationOutcome> existing;
  std::vector<checksum::CreationOutcome> locked;
  std::vector<checksum::CreationOutcome> failed;
};

// Buckets outcomes by status, preserving their order
VerificationSummary summarize(const std::vector<checksum::VerificationOutcome>& results);
CreationSummary summarize(const std::vector<checksum::CreationOutcome>& results);

/**
 * Results of the root argument currently being processed plus the
 * run-wide traversal error list. The run loop appends; the interrupt
 * handler takes snapshots from its own thread.
 */
class RunState {
public:
  // ---- MUTATION (RUN LOOP) ----
  // Starts a new ResultSet for the next top-level argument
  void begin_root();
  void record(checksum::VerificationOutcome outcome);
  void record(checksum::CreationOutcome outcome);
  void add_error(const std::string& error);


  // ---- SNAPSHOTS ----
  std::vector<checksum::VerificationOutcome> verification_results() const;
  std::vector<checksum::CreationOutcome> creation_results() const;
  std::vector<std::string> errors() const;

private:
  mutable std::mutex mutex_;
  std::vector<checksum::VerificationOutcome> verification_results_;
  std::vector<checksum::CreationOutcome> creation_results_;
  std::vector<std::string> errors_;
};

} // namespace engine
} // namespace csu
