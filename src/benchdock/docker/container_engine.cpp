#include "benchdock/docker/container_engine.hpp"

#include "benchdock/docker/image.hpp"
#include "benchdock/process/process.hpp"
#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <format>

namespace benchdock::docker {

DockerCliEngine::DockerCliEngine(std::string binary)
    : binary_(std::move(binary)) {}

auto DockerCliEngine::images_command(std::string_view image) const
    -> std::string {
  return std::format("{} images -q {}", shell_quote(binary_),
                     shell_quote(image));
}

auto DockerCliEngine::build_command(const BuildRequest& req) const
    -> std::string {
  return std::format("{} build {}-t {} -f {} {}", shell_quote(binary_),
                     req.cache ? "" : "--no-cache ", shell_quote(req.image),
                     shell_quote(req.descriptor.string()),
                     shell_quote(req.context_dir.string()));
}

auto DockerCliEngine::push_command(std::string_view image) const
    -> std::string {
  auto bin = shell_quote(binary_);
  return std::format("{} login && {} push {}", bin, bin, shell_quote(image));
}

auto DockerCliEngine::run_command(const RunRequest& req) const -> std::string {
  auto cmd = std::format(
      "{} run -v {} -v {} --rm {}", shell_quote(binary_),
      shell_quote(std::format("{}:{}", req.input_dir, kContainerInputDir)),
      shell_quote(std::format("{}:{}", req.output_dir, kContainerOutputDir)),
      shell_quote(req.image));
  if (!req.args.empty()) {
    cmd += ' ';
    cmd += shell_join(req.args);
  }
  return cmd;
}

auto DockerCliEngine::check_image(std::string_view image) -> bool {
  auto result = benchdock::run_command(images_command(image));
  if (!result) {
    log::warn("Could not query docker image {}: {}", image,
              result.error().message());
    return false;
  }
  log::debug("docker image id: {}", result->output);
  if (!result->succeeded()) {
    log::warn("docker images exited with code {} for {}", result->exit_code,
              image);
    return false;
  }
  return is_image_id(result->output);
}

auto DockerCliEngine::build_image(const BuildRequest& req)
    -> Result<std::string> {
  auto cmd = build_command(req);
  log::debug("Running: {}", cmd);
  auto result = benchdock::run_command(cmd);
  if (!result) {
    return fail(result.error());
  }
  if (!result->succeeded()) {
    log::error("docker build of {} exited with code {}:\n{}", req.image,
               result->exit_code, result->output);
    return fail(Error::ImageBuildFailed);
  }
  return ok(std::move(result->output));
}

auto DockerCliEngine::push_image(std::string_view image)
    -> Result<std::string> {
  auto result = benchdock::run_command(push_command(image));
  if (!result) {
    return fail(result.error());
  }
  if (!result->succeeded()) {
    log::error("docker push of {} exited with code {}:\n{}", image,
               result->exit_code, result->output);
    return fail(Error::ImagePushFailed);
  }
  return ok(std::move(result->output));
}

auto DockerCliEngine::run_container(const RunRequest& req) -> RunResult {
  auto cmd = run_command(req);
  log::info("Starting docker: {}", cmd);

  RunResult run;
  auto result = benchdock::run_command(cmd);
  if (!result) {
    run.error = result.error().message();
    return run;
  }
  run.exit_code = result->exit_code;
  run.output = std::move(result->output);
  if (run.exit_code != 0) {
    run.error = std::format("{} (exit code {})",
                            make_error_code(Error::ContainerRunFailed).message(),
                            run.exit_code);
  }
  return run;
}

}  // namespace benchdock::docker
