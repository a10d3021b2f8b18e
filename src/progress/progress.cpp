#include "progress/progress.hpp"
#include <unistd.h>
#include <boost/log/trivial.hpp>

namespace csu {
namespace progress {

//==============================================
// FRAMES
//==============================================

std::string build_frame(size_t position) {
  if (position >= PROGRESS_BAR_WIDTH) {
    return done_bar();
  }

  std::string frame;
  frame.reserve(PROGRESS_BAR_WIDTH + 2);
  frame += '[';
  frame.append(position, '=');
  frame += '>';
  frame.append(PROGRESS_BAR_WIDTH - position - 1, ' ');
  frame += ']';
  return frame;
}

std::string done_bar() {
  return "[" + std::string(PROGRESS_BAR_WIDTH, '=') + "]";
}

bool is_terminal(int fd) {
  return ::isatty(fd) == 1;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ProgressIndicator::ProgressIndicator(std::ostream& out, std::string prefix, bool enabled,
                                     std::chrono::milliseconds period, OutputGuard* guard)
  : out_(out)
  , prefix_(std::move(prefix))
  , enabled_(enabled)
  , period_(period)
  , guard_(guard)
  , stop_requested_(false) {
  if (!enabled_) {
    return;
  }
  ticker_thread_ = std::make_unique<std::thread>([this]() { run(); });
}

ProgressIndicator::~ProgressIndicator() {
  stop();
}


//==============================================
// CONTROL
//==============================================

void ProgressIndicator::run() {
  size_t position = 0;
  std::unique_lock<std::mutex> lock(mutex_);

  // Frames are written under the lock so none can follow stop()
  while (!stop_requested_) {
    draw(position);
    position = (position + 1) % (PROGRESS_BAR_WIDTH + 1);
    stop_cv_.wait_for(lock, period_, [this]() { return stop_requested_; });
  }
}

void ProgressIndicator::draw(size_t position) {
  if (!guard_) {
    out_ << '\r' << prefix_ << build_frame(position) << std::flush;
    return;
  }

  std::lock_guard<std::mutex> lock(guard_->mutex);
  if (guard_->closed) {
    return;
  }
  out_ << '\r' << prefix_ << build_frame(position) << std::flush;
}

void ProgressIndicator::stop() {
  if (!ticker_thread_) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  stop_cv_.notify_all();

  if (ticker_thread_->joinable()) {
    ticker_thread_->join();
  }
  ticker_thread_.reset();
  BOOST_LOG_TRIVIAL(trace) << "Progress: Indicator stopped for " << prefix_;
}

void ProgressIndicator::clear_line() {
  if (!enabled_) {
    return;
  }
  out_ << '\r' << prefix_ << std::string(PROGRESS_BAR_WIDTH + 2, ' ') << '\r' << prefix_;
}

} // namespace progress
} // namespace csu
