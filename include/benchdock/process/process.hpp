#pragma once

#include "benchdock/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace benchdock {

struct CommandOutput {
  int exit_code{-1};
  std::string output;  // stdout and stderr interleaved

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return exit_code == 0;
  }
};

struct CommandOptions {
  std::string working_dir;
  std::size_t max_output{10 * 1024 * 1024};
};

// Runs `cmd` through /bin/sh and blocks until it exits. A non-zero exit code
// is reported in CommandOutput; only failing to start the process is an error.
[[nodiscard]] auto run_command(std::string_view cmd,
                               const CommandOptions& options = {})
    -> Result<CommandOutput>;

}  // namespace benchdock
