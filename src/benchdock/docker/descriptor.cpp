#include "benchdock/docker/descriptor.hpp"

#include "benchdock/util/log.hpp"

#include <format>
#include <fstream>

namespace benchdock::docker {

namespace {

// {0}: custom setup commands, {1}: framework name, {2}: entry point script.
// The framework gets its own virtualenv so its packages cannot clash with
// those of the benchmark application.
constexpr std::string_view kDescriptorTemplate = R"(FROM ubuntu:18.04

RUN apt-get update
RUN apt-get install -y curl wget unzip git
RUN apt-get install -y python3 python3-pip python3-venv
RUN pip3 install --upgrade pip

ENV PIP /venvs/bench/bin/pip3
ENV PY /venvs/bench/bin/python3 -W ignore
ENV SPIP pip3
ENV SPY python3

RUN $SPY -m venv /venvs/bench
RUN $PIP install --upgrade pip

WORKDIR /bench
VOLUME /input
VOLUME /output

# Application tree, minus the entries of .dockerignore
ADD . /bench/

RUN $PIP install --no-cache-dir -r requirements.txt
RUN $PIP install --no-cache-dir openml

{0}

ENTRYPOINT ["/bin/bash", "-c", "$PY {2} $0 $*"]
CMD ["{1}", "test"]

)";

}  // namespace

DescriptorGenerator::DescriptorGenerator(std::string script,
                                         std::string descriptor_name)
    : script_(std::move(script)), descriptor_name_(std::move(descriptor_name)) {}

auto DescriptorGenerator::render(std::string_view framework_name,
                                 std::string_view custom_commands) const
    -> std::string {
  return std::vformat(kDescriptorTemplate,
                      std::make_format_args(custom_commands, framework_name,
                                            script_));
}

auto DescriptorGenerator::generate(const std::filesystem::path& framework_dir,
                                   std::string_view framework_name,
                                   std::string_view custom_commands) const
    -> Result<std::filesystem::path> {
  auto path = descriptor_path(framework_dir);
  auto content = render(framework_name, custom_commands);

  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    log::error("Failed to open {} for writing", path.string());
    return fail(Error::FileWriteFailed);
  }
  file << content;
  file.close();
  if (!file) {
    log::error("Failed to write {}", path.string());
    return fail(Error::FileWriteFailed);
  }

  log::info("Generated build descriptor {} for {}", path.string(),
            framework_name);
  return ok(std::move(path));
}

}  // namespace benchdock::docker
