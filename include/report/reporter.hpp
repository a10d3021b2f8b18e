#pragma once

#include <chrono>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>
#include "checksum/outcome.hpp"
#include "progress/progress.hpp"

namespace csu {
namespace report {

static constexpr const char* PROJECT_URL = "https://github.com/JuanOrbegoso/checksum-utils";

// ---- FORMATTING ----
// "250ms", "42s", "3m7s", "1h2m3s"
std::string format_duration(std::chrono::nanoseconds duration);
const char* status_icon(checksum::VerificationStatus status);
const char* status_icon(checksum::CreationStatus status);
// Absence outcomes are reported without timing
bool shows_duration(checksum::VerificationStatus status);
bool shows_duration(checksum::CreationStatus status);
// "- <path> "
std::string file_prefix(const std::filesystem::path& path);


// Presentation of a run: header, per-file lines, summaries, errors
class Reporter {
public:
  // ---- CONSTRUCTOR ----
  explicit Reporter(std::ostream& out);


  // ---- RUN OUTPUT ----
  void print_header(const std::string& version);
  void print_processing(const std::string& root);
  // Finishes the line started by the indicator (or prints its prefix when inert)
  void print_file_result(progress::ProgressIndicator& indicator,
                         const checksum::VerificationOutcome& outcome,
                         std::chrono::nanoseconds elapsed);
  void print_file_result(progress::ProgressIndicator& indicator,
                         const checksum::CreationOutcome& outcome,
                         std::chrono::nanoseconds elapsed);


  // ---- SUMMARIES ----
  void print_summary(const std::vector<checksum::VerificationOutcome>& results);
  void print_summary(const std::vector<checksum::CreationOutcome>& results);
  void print_errors(const std::vector<std::string>& errors);

  // Prints whatever a cut-short run has gathered and closes the output:
  // neither the reporter nor a progress indicator sharing guard() writes
  // anything afterwards
  void print_interrupted(const std::vector<checksum::VerificationOutcome>& verification_results,
                         const std::vector<checksum::CreationOutcome>& creation_results,
                         const std::vector<std::string>& errors);


  // ---- GETTERS ----
  std::ostream& out() { return out_; }
  progress::OutputGuard& guard() { return guard_; }

private:
  std::ostream& out_;
  progress::OutputGuard guard_;

  void write_summary(const std::vector<checksum::VerificationOutcome>& results);
  void write_summary(const std::vector<checksum::CreationOutcome>& results);
  void write_errors(const std::vector<std::string>& errors);

  template <typename Outcome>
  void finish_file_line(progress::ProgressIndicator& indicator, const Outcome& outcome,
                        std::chrono::nanoseconds elapsed);
};

} // namespace report
} // namespace csu
