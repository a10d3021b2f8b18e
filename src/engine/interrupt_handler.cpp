#include "engine/interrupt_handler.hpp"
#include <boost/log/trivial.hpp>
#include <csignal>

namespace csu {
namespace engine {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

InterruptHandler::InterruptHandler(ShutdownHook hook)
  : hook_(std::move(hook))
  , signals_(io_context_)
  , is_running_(false) {
  BOOST_LOG_TRIVIAL(debug) << "Interrupt handler: Created";
}

InterruptHandler::~InterruptHandler() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool InterruptHandler::start() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "Interrupt handler: Already running";
    return false;
  }

  boost::system::error_code ec;
  signals_.add(SIGINT, ec);
  if (!ec) {
    signals_.add(SIGTERM, ec);
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Interrupt handler: Failed to register signals: " << ec.message();
    signals_.clear(ec);
    return false;
  }

  await_signal();
  is_running_ = true;

  io_thread_ = std::make_unique<std::thread>([this]() {
    try {
      io_context_.run();
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Interrupt handler: IO context error: " << e.what();
    }
  });

  BOOST_LOG_TRIVIAL(info) << "Interrupt handler: Listening for SIGINT and SIGTERM";
  return true;
}

void InterruptHandler::await_signal() {
  signals_.async_wait(
    [this](const boost::system::error_code& error, int signal_number) {
      if (error) {
        if (error != boost::asio::error::operation_aborted) {
          BOOST_LOG_TRIVIAL(error) << "Interrupt handler: Wait failed: " << error.message();
        }
        return;
      }

      BOOST_LOG_TRIVIAL(warning) << "Interrupt handler: Received signal " << signal_number;
      if (hook_) {
        hook_(signal_number);
      }
      await_signal();
    });
}

void InterruptHandler::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(debug) << "Interrupt handler: Shutting down";
  is_running_ = false;

  boost::system::error_code ec;
  signals_.cancel(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Interrupt handler: Error cancelling wait: " << ec.message();
  }
  signals_.clear(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Interrupt handler: Error restoring signal handlers: " << ec.message();
  }

  io_context_.stop();

  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }
  io_thread_.reset();

  BOOST_LOG_TRIVIAL(debug) << "Interrupt handler: Shutdown complete";
}

} // namespace engine
} // namespace csu
