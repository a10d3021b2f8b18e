#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <vector>
#include "engine/run_state.hpp"
#include "report/reporter.hpp"

namespace csu {
namespace engine {

struct EngineOptions {
  // Source of the piped-in path list
  std::istream* input{nullptr};
  bool input_is_tty{true};
  bool progress_enabled{false};
  std::string version;
};

// Sequential run loop: expands the inputs, classifies every candidate
// one at a time and reports per root argument
class Engine {
public:
  // ---- CONSTRUCTOR ----
  Engine(RunState& state, report::Reporter& reporter, EngineOptions options);


  // ---- ENTRY OPERATIONS ----
  // Verifies existing sidecars; returns the process status
  int check(const std::vector<std::string>& args);
  // Generates missing sidecars; returns the process status
  int create(const std::vector<std::string>& args);

private:
  // ---- PARAMETERS ----
  RunState& state_;
  report::Reporter& reporter_;
  EngineOptions options_;

  template <typename Classify, typename Snapshot>
  int run(const char* operation, const std::vector<std::string>& args,
          Classify classify, Snapshot snapshot);
};

} // namespace engine
} // namespace csu
