#pragma once

#include "benchdock/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace benchdock::docker {

inline constexpr std::string_view kContainerInputDir = "/input";
inline constexpr std::string_view kContainerOutputDir = "/output";

struct BuildRequest {
  std::string image;
  std::filesystem::path descriptor;
  std::filesystem::path context_dir{"."};
  bool cache{true};
};

struct RunRequest {
  std::string image;
  std::string input_dir;
  std::string output_dir;
  std::vector<std::string> args;
};

struct RunResult {
  int exit_code{-1};
  std::string output;
  std::string error;

  [[nodiscard]] auto succeeded() const noexcept -> bool {
    return error.empty() && exit_code == 0;
  }
};

// Port onto the container engine. Each call is one synchronous engine
// invocation.
class IContainerEngine {
public:
  virtual ~IContainerEngine() = default;

  // Never fails: unparseable output or a failed query means "absent".
  [[nodiscard]] virtual auto check_image(std::string_view image) -> bool = 0;

  [[nodiscard]] virtual auto build_image(const BuildRequest& req)
      -> Result<std::string> = 0;

  [[nodiscard]] virtual auto push_image(std::string_view image)
      -> Result<std::string> = 0;

  // Mounts input_dir read side at /input, output_dir at /output and removes
  // the container on exit.
  [[nodiscard]] virtual auto run_container(const RunRequest& req)
      -> RunResult = 0;
};

// Binding onto the docker command line client.
class DockerCliEngine : public IContainerEngine {
public:
  explicit DockerCliEngine(std::string binary = "docker");

  [[nodiscard]] auto check_image(std::string_view image) -> bool override;
  [[nodiscard]] auto build_image(const BuildRequest& req)
      -> Result<std::string> override;
  [[nodiscard]] auto push_image(std::string_view image)
      -> Result<std::string> override;
  [[nodiscard]] auto run_container(const RunRequest& req)
      -> RunResult override;

  [[nodiscard]] auto images_command(std::string_view image) const
      -> std::string;
  [[nodiscard]] auto build_command(const BuildRequest& req) const
      -> std::string;
  [[nodiscard]] auto push_command(std::string_view image) const
      -> std::string;
  [[nodiscard]] auto run_command(const RunRequest& req) const -> std::string;

private:
  std::string binary_;
};

}  // namespace benchdock::docker
