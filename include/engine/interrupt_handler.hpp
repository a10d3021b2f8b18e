#pragma once

#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <thread>

namespace csu {
namespace engine {

// Watches SIGINT and SIGTERM on a dedicated io thread and runs the
// registered shutdown hook on delivery. The hook decides whether the
// process exits; the handler keeps listening if it returns.
class InterruptHandler {
public:
  using ShutdownHook = std::function<void(int signal_number)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit InterruptHandler(ShutdownHook hook);
  ~InterruptHandler();

  InterruptHandler(const InterruptHandler&) = delete;
  InterruptHandler& operator=(const InterruptHandler&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start();
  // Restores default signal dispositions and joins the io thread
  void shutdown();

  bool is_running() const { return is_running_; }

private:
  // ---- PARAMETERS ----
  ShutdownHook hook_;

  // Handler state
  boost::asio::io_context io_context_;
  boost::asio::signal_set signals_;
  std::unique_ptr<std::thread> io_thread_;
  bool is_running_;

  void await_signal();
};

} // namespace engine
} // namespace csu
