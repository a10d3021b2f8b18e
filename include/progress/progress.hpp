#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace csu {
namespace progress {

static constexpr size_t PROGRESS_BAR_WIDTH = 10;
static constexpr std::chrono::milliseconds TICK_PERIOD{120};

// "[===>      ]" with the head at position; position >= width gives a full bar
std::string build_frame(size_t position);
std::string done_bar();

// True when fd is attached to an interactive terminal
bool is_terminal(int fd);

// Shared by everything drawing on one console stream. Once closed, the
// stream is left exactly as the last writer put it.
struct OutputGuard {
  std::mutex mutex;
  bool closed{false};
};

// Animated per-file indicator. When enabled, a ticker thread redraws
// "\r<prefix><frame>" every period until stop() is called. Disabled
// indicators never write anything.
class ProgressIndicator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ProgressIndicator(std::ostream& out, std::string prefix, bool enabled,
                    std::chrono::milliseconds period = TICK_PERIOD,
                    OutputGuard* guard = nullptr);
  ~ProgressIndicator();

  ProgressIndicator(const ProgressIndicator&) = delete;
  ProgressIndicator& operator=(const ProgressIndicator&) = delete;


  // ---- CONTROL ----
  // Returns once the ticker thread has exited; safe to call repeatedly
  void stop();
  // Blanks the bar and leaves the cursor right after the prefix
  void clear_line();


  // ---- GETTERS ----
  bool enabled() const { return enabled_; }
  const std::string& prefix() const { return prefix_; }

private:
  // ---- PARAMETERS ----
  std::ostream& out_;
  const std::string prefix_;
  const bool enabled_;
  const std::chrono::milliseconds period_;
  OutputGuard* guard_;

  // Ticker state
  std::mutex mutex_;
  std::condition_variable stop_cv_;
  bool stop_requested_;
  std::unique_ptr<std::thread> ticker_thread_;

  void run();
  void draw(size_t position);
};

} // namespace progress
} // namespace csu
