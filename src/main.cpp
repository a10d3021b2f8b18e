#include "cli/cli.hpp"
#include "progress/progress.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <unistd.h>

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);

  csu::cli::CLI cli(std::cin, std::cout, std::cerr,
                    csu::progress::is_terminal(STDIN_FILENO),
                    csu::progress::is_terminal(STDOUT_FILENO));
  return cli.run(args);
}
