#include "cli/cli.hpp"
#include "engine/engine.hpp"
#include "engine/interrupt_handler.hpp"
#include "engine/run_state.hpp"
#include "report/reporter.hpp"
#include <cstdlib>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>

namespace csu {
namespace cli {

//==============================================
// ARGUMENT PARSING
//==============================================

ProgramOptions parse_command_line(const std::vector<std::string>& args) {
  ProgramOptions options;
  bool options_ended = false;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (!options_ended && arg == "--") {
      options_ended = true;
      continue;
    }

    if (!options_ended && arg.size() > 1 && arg[0] == '-') {
      if (arg == "-h" || arg == "--help") {
        options.command = "help";
      } else if (arg == "-v" || arg == "--version") {
        options.command = "version";
      } else if (arg == "--no-progress") {
        options.progress = false;
      } else if (arg == "--log-file" || arg == "--log-level") {
        if (i + 1 >= args.size()) {
          options.error = "Missing value for " + arg;
          return options;
        }
        const std::string& value = args[++i];
        if (arg == "--log-file") {
          options.log_file = value;
        } else if (!logger::parse_severity(value, options.log_level)) {
          options.error = "Invalid log level: " + value;
          return options;
        }
      } else {
        options.error = "Unknown argument: " + arg;
        return options;
      }
      continue;
    }

    if (options.command.empty()) {
      options.command = arg;
    } else {
      options.paths.push_back(arg);
    }
  }

  if (options.command.empty()) {
    options.error = "Missing command";
    return options;
  }
  if (options.command != "check" && options.command != "create" &&
      options.command != "help" && options.command != "version") {
    options.error = "Unknown command: " + options.command;
    return options;
  }

  options.valid = true;
  return options;
}

void print_usage(std::ostream& out) {
  out << "Multiplatform checksum utils.\n\n"
      << "Usage: " << PROGRAM_NAME << " <command> [options] [paths...]\n\n"
      << "Commands:\n"
      << "  check     Compare files with their .sha512 checksum files\n"
      << "  create    Create missing .sha512 checksum files\n"
      << "  help      Display this help message\n"
      << "  version   Print the version\n\n"
      << "Options:\n"
      << "  --log-file <path>    Write a diagnostic log to <path>\n"
      << "  --log-level <level>  trace, debug, info, warning, error or fatal (default info)\n"
      << "  --no-progress        Disable the progress animation\n\n"
      << "Paths may be files, directories or glob patterns. When standard input\n"
      << "is not a terminal, a newline-delimited list of paths is read from it.\n\n"
      << "Example:\n"
      << "  " << PROGRAM_NAME << " create ~/documents\n"
      << "  " << PROGRAM_NAME << " check /mnt/external-disk/budget.pdf\n"
      << "  find . -name '*.pdf' | " << PROGRAM_NAME << " check\n";
}


//==============================================
// INTERRUPTION
//==============================================

[[noreturn]] void flush_partial_results_and_exit(const engine::RunState& state,
                                                 report::Reporter& reporter, int signal_number) {
  BOOST_LOG_TRIVIAL(warning) << "CLI: Interrupted by signal " << signal_number << ", flushing partial results";
  reporter.print_interrupted(state.verification_results(), state.creation_results(), state.errors());
  boost::log::core::get()->flush();
  std::_Exit(1);
}


//==============================================
// CONSTRUCTOR
//==============================================

CLI::CLI(std::istream& in, std::ostream& out, std::ostream& err,
         bool input_is_tty, bool output_is_tty)
  : in_(in)
  , out_(out)
  , err_(err)
  , input_is_tty_(input_is_tty)
  , output_is_tty_(output_is_tty) {}


//==============================================
// STARTUP
//==============================================

int CLI::run(const std::vector<std::string>& args) {
  const ProgramOptions options = parse_command_line(args);
  if (!options.valid) {
    err_ << "Error: " << options.error << '\n';
    print_usage(err_);
    return 1;
  }

  if (options.command == "help") {
    print_usage(out_);
    return 0;
  }
  if (options.command == "version") {
    out_ << PROGRAM_NAME << " version " << VERSION << std::endl;
    return 0;
  }

  if (options.paths.empty() && input_is_tty_) {
    err_ << "Error: " << options.command << " requires at least one path\n";
    print_usage(err_);
    return 1;
  }

  if (!configure_logging(options)) {
    return 1;
  }

  try {
    return dispatch(options);
  } catch (const std::exception& e) {
    log_and_display_error("Error running " + options.command, e.what());
    return 1;
  }
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::configure_logging(const ProgramOptions& options) {
  if (options.log_file.empty()) {
    // Without a sink Boost.Log would fall back to writing on the console
    logger::disable_logging();
    return true;
  }

  try {
    logger::init_logging(options.log_file, options.log_level);
    return true;
  } catch (const std::exception& e) {
    err_ << "Error: Failed to open log file " << options.log_file << ": " << e.what() << std::endl;
    return false;
  }
}

int CLI::dispatch(const ProgramOptions& options) {
  BOOST_LOG_TRIVIAL(info) << "CLI: Dispatching " << options.command << " for "
                          << options.paths.size() << " arguments";

  engine::RunState state;
  report::Reporter reporter(out_);

  engine::InterruptHandler interrupt_handler([&state, &reporter](int signal_number) {
    flush_partial_results_and_exit(state, reporter, signal_number);
  });
  if (!interrupt_handler.start()) {
    BOOST_LOG_TRIVIAL(warning) << "CLI: Running without interrupt handling";
  }

  engine::EngineOptions engine_options;
  engine_options.input = &in_;
  engine_options.input_is_tty = input_is_tty_;
  engine_options.progress_enabled = options.progress && output_is_tty_;
  engine_options.version = VERSION;

  engine::Engine engine(state, reporter, engine_options);
  int status = options.command == "check" ? engine.check(options.paths)
                                          : engine.create(options.paths);

  interrupt_handler.shutdown();
  return status;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  err_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace csu
