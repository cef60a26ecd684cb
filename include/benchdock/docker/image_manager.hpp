#pragma once

#include "benchdock/config/definitions.hpp"
#include "benchdock/config/system_config.hpp"
#include "benchdock/core/error.hpp"
#include "benchdock/docker/container_engine.hpp"
#include "benchdock/docker/descriptor.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace benchdock::docker {

enum class SetupMode : std::uint8_t { Auto, Skip, Force, Only };

[[nodiscard]] constexpr auto to_string_view(SetupMode mode) noexcept
    -> std::string_view {
  switch (mode) {
    case SetupMode::Auto: return "auto";
    case SetupMode::Skip: return "skip";
    case SetupMode::Force: return "force";
    case SetupMode::Only: return "only";
  }
  return "auto";
}

[[nodiscard]] auto parse_setup_mode(std::string_view s) -> Result<SetupMode>;

enum class ImageState : std::uint8_t {
  Unknown,
  Checked,
  Skipped,
  Built,
  Published,
  Done,
};

[[nodiscard]] constexpr auto to_string_view(ImageState state) noexcept
    -> std::string_view {
  switch (state) {
    case ImageState::Unknown: return "unknown";
    case ImageState::Checked: return "checked";
    case ImageState::Skipped: return "skipped";
    case ImageState::Built: return "built";
    case ImageState::Published: return "published";
    case ImageState::Done: return "done";
  }
  return "unknown";
}

struct BuildOptions {
  bool cache{true};
  bool upload{false};
};

struct SetupReport {
  std::string image;
  ImageState state{ImageState::Unknown};
  bool built{false};
};

// Detects, builds and publishes the image of one framework.
class ImageManager {
public:
  ImageManager(IContainerEngine& engine, const DockerConfig& docker,
               const RunConfiguration& run);

  [[nodiscard]] auto exists(const FrameworkDefinition& framework) -> bool;

  // Regenerates the descriptor, builds, then publishes when requested.
  [[nodiscard]] auto build(const FrameworkDefinition& framework,
                           const BuildOptions& options) -> Result<SetupReport>;

  [[nodiscard]] auto publish(const FrameworkDefinition& framework)
      -> Result<void>;

  // skip: nothing. auto: build with cache unless the image exists.
  // force: build without cache. only: build with cache.
  [[nodiscard]] auto setup(const FrameworkDefinition& framework,
                           SetupMode mode, bool upload = false)
      -> Result<SetupReport>;

  [[nodiscard]] auto framework_dir(const FrameworkDefinition& framework) const
      -> std::filesystem::path;

private:
  IContainerEngine& engine_;
  DockerConfig docker_;
  DescriptorGenerator generator_;
};

}  // namespace benchdock::docker
