#pragma once

#include "benchdock/config/system_config.hpp"
#include "benchdock/docker/container_engine.hpp"

#include <string>
#include <vector>

namespace benchdock::docker {

// Runs in-container command lines against one image with the run
// configuration's host directories mounted. Safe to share between workers:
// it holds no per-call state.
class ContainerInvoker {
public:
  ContainerInvoker(IContainerEngine& engine, std::string image,
                   const RunConfiguration& run);

  // Blocks until the container exits. A non-zero exit is reported in the
  // result, never retried.
  [[nodiscard]] auto run(const std::vector<std::string>& params) const
      -> RunResult;

  [[nodiscard]] auto image() const noexcept -> const std::string& {
    return image_;
  }

private:
  IContainerEngine& engine_;
  std::string image_;
  std::string input_dir_;
  std::string output_dir_;
};

}  // namespace benchdock::docker
