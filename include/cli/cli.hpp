#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "logger/logger.hpp"

namespace csu {
namespace engine { class RunState; }
namespace report { class Reporter; }

namespace cli {

static constexpr const char* VERSION = "v0.1.0";
static constexpr const char* PROGRAM_NAME = "checksum-utils";

struct ProgramOptions {
  std::string command;
  std::vector<std::string> paths;
  std::string log_file;
  logger::severity_level log_level{logger::severity_level::info};
  bool progress{true};
  bool valid{false};
  std::string error;
};

// Parses everything after the program name; options may appear anywhere
ProgramOptions parse_command_line(const std::vector<std::string>& args);
void print_usage(std::ostream& out);

// Shutdown hook of an interrupted run: prints the partial summaries and
// errors held in state, flushes output and logs, then exits with status 1
[[noreturn]] void flush_partial_results_and_exit(const engine::RunState& state,
                                                 report::Reporter& reporter, int signal_number);

class CLI {
public:
  // ---- CONSTRUCTOR ----
  CLI(std::istream& in, std::ostream& out, std::ostream& err,
      bool input_is_tty, bool output_is_tty);


  // ---- STARTUP ----
  // Returns the process exit status
  int run(const std::vector<std::string>& args);

private:
  // ---- PARAMETERS ----
  std::istream& in_;
  std::ostream& out_;
  std::ostream& err_;
  const bool input_is_tty_;
  const bool output_is_tty_;


  // ---- COMMAND PROCESSING ----
  bool configure_logging(const ProgramOptions& options);
  int dispatch(const ProgramOptions& options);
  void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace csu
