#pragma once

#include "benchdock/core/error.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace benchdock::docker {

// Renders the Dockerfile that embeds the benchmark application together with
// one framework's dependencies.
class DescriptorGenerator {
public:
  explicit DescriptorGenerator(std::string script,
                               std::string descriptor_name = "Dockerfile");

  [[nodiscard]] auto render(std::string_view framework_name,
                            std::string_view custom_commands) const
      -> std::string;

  // Overwrites `<framework_dir>/<descriptor_name>` and returns its path.
  [[nodiscard]] auto generate(const std::filesystem::path& framework_dir,
                              std::string_view framework_name,
                              std::string_view custom_commands) const
      -> Result<std::filesystem::path>;

  [[nodiscard]] auto descriptor_path(
      const std::filesystem::path& framework_dir) const
      -> std::filesystem::path {
    return framework_dir / descriptor_name_;
  }

private:
  std::string script_;
  std::string descriptor_name_;
};

}  // namespace benchdock::docker
