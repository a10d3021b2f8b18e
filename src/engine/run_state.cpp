#include "engine/run_state.hpp"
#include <boost/log/trivial.hpp>

namespace csu {
namespace engine {

using checksum::CreationOutcome;
using checksum::CreationStatus;
using checksum::VerificationOutcome;
using checksum::VerificationStatus;

//==============================================
// SUMMARIES
//==============================================

VerificationSummary summarize(const std::vector<VerificationOutcome>& results) {
  VerificationSummary summary;
  summary.total = results.size();

  for (const auto& result : results) {
    switch (result.status()) {
      case VerificationStatus::Match:
        ++summary.matched;
        break;
      case VerificationStatus::NotMatch:
        summary.not_matched.push_back(result);
        break;
      case VerificationStatus::NotFound:
        summary.not_found.push_back(result);
        break;
      case VerificationStatus::Locked:
        summary.locked.push_back(result);
        break;
      case VerificationStatus::CheckingFailed:
        summary.failed.push_back(result);
        break;
    }
  }
  return summary;
}

CreationSummary summarize(const std::vector<CreationOutcome>& results) {
  CreationSummary summary;
  summary.total = results.size();

  for (const auto& result : results) {
    switch (result.status()) {
      case CreationStatus::Created:
        ++summary.created;
        break;
      case CreationStatus::Existing:
        summary.existing.push_back(result);
        break;
      case CreationStatus::LockedCreation:
        summary.locked.push_back(result);
        break;
      case CreationStatus::Failed:
        summary.failed.push_back(result);
        break;
    }
  }
  return summary;
}


//==============================================
// MUTATION (RUN LOOP)
//==============================================

void RunState::begin_root() {
  std::lock_guard<std::mutex> lock(mutex_);
  verification_results_.clear();
  creation_results_.clear();
}

void RunState::record(VerificationOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  verification_results_.push_back(std::move(outcome));
}

void RunState::record(CreationOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex_);
  creation_results_.push_back(std::move(outcome));
}

void RunState::add_error(const std::string& error) {
  BOOST_LOG_TRIVIAL(debug) << "Run state: Recording error: " << error;
  std::lock_guard<std::mutex> lock(mutex_);
  errors_.push_back(error);
}


//==============================================
// SNAPSHOTS
//==============================================

std::vector<VerificationOutcome> RunState::verification_results() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return verification_results_;
}

std::vector<CreationOutcome> RunState::creation_results() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return creation_results_;
}

std::vector<std::string> RunState::errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return errors_;
}

} // namespace engine
} // namespace csu
