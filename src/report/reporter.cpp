#include "report/reporter.hpp"
#include "engine/run_state.hpp"
#include <sstream>

namespace csu {
namespace report {

using checksum::CreationOutcome;
using checksum::CreationStatus;
using checksum::VerificationOutcome;
using checksum::VerificationStatus;

namespace {

template <typename Rep, typename Period>
std::chrono::nanoseconds round_to(std::chrono::nanoseconds value, std::chrono::duration<Rep, Period> unit) {
  const auto step = std::chrono::duration_cast<std::chrono::nanoseconds>(unit);
  return ((value + step / 2) / step) * step;
}

template <typename Outcome>
void print_paths(std::ostream& out, const std::vector<Outcome>& outcomes, bool with_error) {
  for (const auto& outcome : outcomes) {
    out << "- " << outcome.path().string();
    if (with_error && outcome.error()) {
      out << " | Error: " << *outcome.error();
    }
    out << '\n';
  }
}

} // namespace

//==============================================
// FORMATTING
//==============================================

std::string format_duration(std::chrono::nanoseconds duration) {
  using namespace std::chrono;

  if (duration < nanoseconds::zero()) {
    duration = nanoseconds::zero();
  }
  const nanoseconds rounded = round_to(duration, milliseconds(1));

  std::ostringstream ss;
  if (rounded >= seconds(1)) {
    const auto total_seconds = duration_cast<seconds>(round_to(rounded, seconds(1))).count();
    const auto h = total_seconds / 3600;
    const auto m = (total_seconds % 3600) / 60;
    const auto s = total_seconds % 60;

    if (rounded >= hours(1)) {
      ss << h << "h" << m << "m" << s << "s";
    } else if (rounded >= minutes(1)) {
      ss << m << "m" << s << "s";
    } else {
      ss << total_seconds << "s";
    }
    return ss.str();
  }

  ss << duration_cast<milliseconds>(rounded).count() << "ms";
  return ss.str();
}

const char* status_icon(VerificationStatus status) {
  switch (status) {
    case VerificationStatus::Match:          return "✅";
    case VerificationStatus::NotMatch:       return "⚠️";
    case VerificationStatus::NotFound:       return "👻";
    case VerificationStatus::Locked:         return "🔒";
    case VerificationStatus::CheckingFailed: return "❌";
    default:                                 return "?";
  }
}

const char* status_icon(CreationStatus status) {
  switch (status) {
    case CreationStatus::Created:        return "✅";
    case CreationStatus::Existing:       return "📄";
    case CreationStatus::LockedCreation: return "🔒";
    case CreationStatus::Failed:         return "❌";
    default:                             return "?";
  }
}

bool shows_duration(VerificationStatus status) {
  return status != VerificationStatus::NotFound;
}

bool shows_duration(CreationStatus status) {
  return status != CreationStatus::Existing;
}

std::string file_prefix(const std::filesystem::path& path) {
  return "- " + path.string() + " ";
}


//==============================================
// CONSTRUCTOR
//==============================================

Reporter::Reporter(std::ostream& out) : out_(out) {}


//==============================================
// RUN OUTPUT
//==============================================

void Reporter::print_header(const std::string& version) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }
  out_ << "Checksum-Utils " << version << '\n' << PROJECT_URL << std::endl;
}

void Reporter::print_processing(const std::string& root) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }
  out_ << '\n' << "Processing " << root << std::endl;
}

template <typename Outcome>
void Reporter::finish_file_line(progress::ProgressIndicator& indicator, const Outcome& outcome,
                                std::chrono::nanoseconds elapsed) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }

  if (indicator.enabled()) {
    indicator.clear_line();
  } else {
    out_ << indicator.prefix();
  }

  out_ << status_icon(outcome.status());
  if (shows_duration(outcome.status())) {
    out_ << " (" << format_duration(elapsed) << ")";
  }
  out_ << std::endl;
}

void Reporter::print_file_result(progress::ProgressIndicator& indicator,
                                 const VerificationOutcome& outcome,
                                 std::chrono::nanoseconds elapsed) {
  finish_file_line(indicator, outcome, elapsed);
}

void Reporter::print_file_result(progress::ProgressIndicator& indicator,
                                 const CreationOutcome& outcome,
                                 std::chrono::nanoseconds elapsed) {
  finish_file_line(indicator, outcome, elapsed);
}


//==============================================
// SUMMARIES
//==============================================

void Reporter::print_summary(const std::vector<VerificationOutcome>& results) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }
  write_summary(results);
  out_.flush();
}

void Reporter::print_summary(const std::vector<CreationOutcome>& results) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }
  write_summary(results);
  out_.flush();
}

void Reporter::print_errors(const std::vector<std::string>& errors) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }
  write_errors(errors);
  out_.flush();
}

void Reporter::print_interrupted(const std::vector<VerificationOutcome>& verification_results,
                                 const std::vector<CreationOutcome>& creation_results,
                                 const std::vector<std::string>& errors) {
  std::lock_guard<std::mutex> lock(guard_.mutex);
  if (guard_.closed) {
    return;
  }

  // Ends a line a progress frame may have left open
  out_ << '\n';
  write_summary(verification_results);
  write_summary(creation_results);
  write_errors(errors);
  out_.flush();
  guard_.closed = true;
}

void Reporter::write_summary(const std::vector<VerificationOutcome>& results) {
  const engine::VerificationSummary summary = engine::summarize(results);

  if (summary.total > 0) {
    out_ << "Results: " << summary.total << " files processed" << '\n';
  }
  if (summary.matched > 0) {
    out_ << "✅ : " << summary.matched << " checksum files match" << '\n';
  }
  if (!summary.not_matched.empty()) {
    out_ << "⚠️ : " << summary.not_matched.size() << " checksum files not match" << '\n';
    print_paths(out_, summary.not_matched, false);
  }
  if (!summary.not_found.empty()) {
    out_ << "👻 : " << summary.not_found.size() << " files without a checksum file" << '\n';
    print_paths(out_, summary.not_found, false);
  }
  if (!summary.locked.empty()) {
    out_ << "🔒 : " << summary.locked.size() << " files could not be read due to permissions" << '\n';
    print_paths(out_, summary.locked, false);
  }
  if (!summary.failed.empty()) {
    out_ << "❌ : " << summary.failed.size() << " checksum files failed to check" << '\n';
    print_paths(out_, summary.failed, true);
  }
}

void Reporter::write_summary(const std::vector<CreationOutcome>& results) {
  const engine::CreationSummary summary = engine::summarize(results);

  if (summary.total > 0) {
    out_ << "Results: " << summary.total << " files processed" << '\n';
  }
  if (summary.created > 0) {
    out_ << "✅ : " << summary.created << " checksum files created" << '\n';
  }
  if (!summary.existing.empty()) {
    out_ << "📄 : " << summary.existing.size() << " files already had a checksum file" << '\n';
  }
  if (!summary.locked.empty()) {
    out_ << "🔒 : " << summary.locked.size() << " files could not be read due to permissions" << '\n';
    print_paths(out_, summary.locked, false);
  }
  if (!summary.failed.empty()) {
    out_ << "❌ : " << summary.failed.size() << " checksum files failed to create" << '\n';
    print_paths(out_, summary.failed, true);
  }
}

void Reporter::write_errors(const std::vector<std::string>& errors) {
  if (errors.empty()) {
    return;
  }

  out_ << '\n' << "Errors:" << '\n';
  for (const auto& error : errors) {
    out_ << "- " << error << '\n';
  }
}

} // namespace report
} // namespace csu
