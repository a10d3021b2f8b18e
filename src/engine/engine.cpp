#include "engine/engine.hpp"
#include "checksum/classifier.hpp"
#include "progress/progress.hpp"
#include "traversal/traversal.hpp"
#include <chrono>
#include <boost/log/trivial.hpp>

namespace csu {
namespace engine {

//==============================================
// CONSTRUCTOR
//==============================================

Engine::Engine(RunState& state, report::Reporter& reporter, EngineOptions options)
  : state_(state)
  , reporter_(reporter)
  , options_(std::move(options)) {
  BOOST_LOG_TRIVIAL(debug) << "Engine: Initialized (progress "
                           << (options_.progress_enabled ? "enabled" : "disabled") << ")";
}


//==============================================
// ENTRY OPERATIONS
//==============================================

int Engine::check(const std::vector<std::string>& args) {
  return run("check", args,
    [](const std::filesystem::path& path) { return checksum::verify(path); },
    [this]() { return state_.verification_results(); });
}

int Engine::create(const std::vector<std::string>& args) {
  return run("create", args,
    [](const std::filesystem::path& path) { return checksum::create(path); },
    [this]() { return state_.creation_results(); });
}


//==============================================
// RUN LOOP
//==============================================

template <typename Classify, typename Snapshot>
int Engine::run(const char* operation, const std::vector<std::string>& args,
                Classify classify, Snapshot snapshot) {
  BOOST_LOG_TRIVIAL(info) << "Engine: Starting " << operation << " with " << args.size() << " arguments";
  reporter_.print_header(options_.version);

  const traversal::ErrorSink on_error = [this](const std::string& error) {
    state_.add_error(error);
  };

  std::vector<std::string> roots;
  if (options_.input) {
    roots = traversal::gather_roots(args, *options_.input, options_.input_is_tty, on_error);
  } else {
    roots = traversal::expand_args(args, on_error);
  }

  size_t processed = 0;
  for (const auto& root : roots) {
    if (!traversal::stat_root(root, on_error)) {
      continue;
    }

    reporter_.print_processing(root);
    state_.begin_root();

    // Rejected roots (checksum files, non-regular files) only add an error
    auto candidates = traversal::collect_candidates(root, on_error);
    if (!candidates) {
      continue;
    }

    for (const auto& path : *candidates) {
      progress::ProgressIndicator indicator(reporter_.out(), report::file_prefix(path),
                                            options_.progress_enabled, progress::TICK_PERIOD,
                                            &reporter_.guard());
      const auto start = std::chrono::steady_clock::now();
      auto outcome = classify(path);
      const auto elapsed = std::chrono::steady_clock::now() - start;
      indicator.stop();

      state_.record(outcome);
      reporter_.print_file_result(indicator, outcome, elapsed);
      ++processed;
    }

    reporter_.print_summary(snapshot());
  }

  reporter_.print_errors(state_.errors());
  BOOST_LOG_TRIVIAL(info) << "Engine: Finished " << operation << ", " << processed << " files processed";
  return 0;
}

} // namespace engine
} // namespace csu
