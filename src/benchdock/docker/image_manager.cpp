#include "benchdock/docker/image_manager.hpp"

#include "benchdock/docker/image.hpp"
#include "benchdock/util/log.hpp"

namespace benchdock::docker {

auto parse_setup_mode(std::string_view s) -> Result<SetupMode> {
  if (s == "auto")
    return SetupMode::Auto;
  if (s == "skip")
    return SetupMode::Skip;
  if (s == "force")
    return SetupMode::Force;
  if (s == "only")
    return SetupMode::Only;
  return fail(Error::InvalidArgument);
}

ImageManager::ImageManager(IContainerEngine& engine, const DockerConfig& docker,
                           const RunConfiguration& run)
    : engine_(engine),
      docker_(docker),
      generator_(run.script, docker.descriptor) {}

auto ImageManager::framework_dir(const FrameworkDefinition& framework) const
    -> std::filesystem::path {
  return std::filesystem::path{docker_.frameworks_dir} / framework.module_dir();
}

auto ImageManager::exists(const FrameworkDefinition& framework) -> bool {
  return engine_.check_image(image_reference(framework));
}

auto ImageManager::publish(const FrameworkDefinition& framework)
    -> Result<void> {
  auto image = image_reference(framework);
  log::info("Publishing docker image {}", image);
  auto output = engine_.push_image(image);
  if (!output) {
    log::error("Failed to publish docker image {}: {}", image,
               output.error().message());
    return fail(output.error());
  }
  log::info("Successfully published docker image {}", image);
  log::debug("{}", *output);
  return ok();
}

auto ImageManager::build(const FrameworkDefinition& framework,
                         const BuildOptions& options) -> Result<SetupReport> {
  SetupReport report{.image = image_reference(framework),
                     .state = ImageState::Checked,
                     .built = false};

  auto descriptor = generator_.generate(framework_dir(framework),
                                        framework.name,
                                        framework.setup_commands);
  if (!descriptor) {
    return fail(descriptor.error());
  }

  log::info("Building docker image {}", report.image);
  auto output = engine_.build_image(BuildRequest{
      .image = report.image,
      .descriptor = *descriptor,
      .context_dir = docker_.build_context,
      .cache = options.cache,
  });
  if (!output) {
    log::error("Failed to build docker image {}: {}", report.image,
               output.error().message());
    return fail(output.error());
  }
  log::info("Successfully built docker image {}", report.image);
  log::debug("{}", *output);
  report.state = ImageState::Built;
  report.built = true;

  if (options.upload) {
    if (auto r = publish(framework); !r) {
      return fail(r.error());
    }
    report.state = ImageState::Published;
    return ok(std::move(report));
  }

  report.state = ImageState::Done;
  return ok(std::move(report));
}

auto ImageManager::setup(const FrameworkDefinition& framework, SetupMode mode,
                         bool upload) -> Result<SetupReport> {
  if (mode == SetupMode::Skip) {
    log::debug("Skipping setup of {}", framework.name);
    return ok(SetupReport{.image = image_reference(framework),
                          .state = ImageState::Skipped,
                          .built = false});
  }

  if (mode == SetupMode::Auto && exists(framework)) {
    auto image = image_reference(framework);
    log::info("Docker image {} already exists, skipping build", image);
    return ok(SetupReport{.image = std::move(image),
                          .state = ImageState::Done,
                          .built = false});
  }

  return build(framework, BuildOptions{.cache = mode != SetupMode::Force,
                                       .upload = upload});
}

}  // namespace benchdock::docker
