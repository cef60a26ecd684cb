#include "benchdock/docker/container_invoker.hpp"

#include "benchdock/util/log.hpp"

namespace benchdock::docker {

ContainerInvoker::ContainerInvoker(IContainerEngine& engine, std::string image,
                                   const RunConfiguration& run)
    : engine_(engine),
      image_(std::move(image)),
      input_dir_(run.input_dir),
      output_dir_(run.output_dir) {}

auto ContainerInvoker::run(const std::vector<std::string>& params) const
    -> RunResult {
  log::info("Datasets are loaded by default from folder {}", input_dir_);
  log::info("Generated files will be available in folder {}", output_dir_);

  auto result = engine_.run_container(RunRequest{
      .image = image_,
      .input_dir = input_dir_,
      .output_dir = output_dir_,
      .args = params,
  });

  if (result.succeeded()) {
    log::debug("{}", result.output);
  } else {
    log::error("Container run on {} failed: {}\n{}", image_, result.error,
               result.output);
  }
  return result;
}

}  // namespace benchdock::docker
