#include "benchdock/config/definition_resolver.hpp"

#include "benchdock/config/yaml_utils.hpp"
#include "benchdock/util/log.hpp"
#include "benchdock/util/util.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace YAML {

template <>
struct convert<benchdock::DockerImage> {
  static bool decode(const Node& node, benchdock::DockerImage& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.author = benchdock::yaml_get_or<std::string>(node, "author", "automlbenchmark");
    if (auto image = node["image"]; image && !image.IsNull()) {
      d.image = image.as<std::string>();
    }
    d.tag = benchdock::yaml_get_or<std::string>(node, "tag", "latest");
    return true;
  }
};

template <>
struct convert<benchdock::TaskDefinition> {
  static bool decode(const Node& node, benchdock::TaskDefinition& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.name = benchdock::yaml_get_or<std::string>(node, "name", "");
    t.folds = benchdock::yaml_get_or(node, "folds", 10);
    if (auto id = node["openml_task_id"]; id && !id.IsNull()) {
      t.openml_task_id = id.as<std::int64_t>();
    }
    if (auto rt = node["max_runtime_seconds"]; rt && !rt.IsNull()) {
      t.max_runtime_seconds = rt.as<int>();
    }
    return true;
  }
};

}  // namespace YAML

namespace benchdock {

namespace {

auto read_file(const std::filesystem::path& path) -> Result<std::string> {
  std::ifstream file(path);
  if (!file.is_open()) {
    log::error("Failed to open definition file: {}", path.string());
    return fail(Error::FileNotFound);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ok(buffer.str());
}

}  // namespace

auto BenchmarkDefinition::find_task(std::string_view task_name) const
    -> const TaskDefinition* {
  auto it = std::ranges::find(tasks, task_name, &TaskDefinition::name);
  return it != tasks.end() ? &*it : nullptr;
}

FileDefinitionResolver::FileDefinitionResolver(
    std::filesystem::path frameworks_file, std::filesystem::path benchmarks_dir)
    : frameworks_file_(std::move(frameworks_file)),
      benchmarks_dir_(std::move(benchmarks_dir)) {}

auto FileDefinitionResolver::parse_frameworks(std::string_view yaml_str)
    -> Result<std::vector<FrameworkDefinition>> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsMap()) {
      log::error("Framework definitions must be a map of name to definition");
      return fail(Error::ParseError);
    }

    std::vector<FrameworkDefinition> frameworks;
    for (const auto& entry : root) {
      FrameworkDefinition def;
      def.name = entry.first.as<std::string>();
      const auto& node = entry.second;
      if (node.IsMap()) {
        def.module = yaml_get_or<std::string>(node, "module", "");
        def.setup_commands = yaml_get_or<std::string>(node, "setup_commands", "");
        if (auto image = node["docker_image"]) {
          def.docker_image = image.as<DockerImage>();
        }
      } else if (!node.IsNull()) {
        log::error("Invalid definition for framework '{}'", def.name);
        return fail(Error::ParseError);
      }
      frameworks.push_back(std::move(def));
    }
    return ok(std::move(frameworks));
  } catch (const YAML::Exception& e) {
    log::error("Failed to parse framework definitions: {}", e.what());
    return fail(Error::ParseError);
  }
}

auto FileDefinitionResolver::parse_benchmark(std::string_view name,
                                             std::string_view yaml_str)
    -> Result<BenchmarkDefinition> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsSequence()) {
      log::error("Benchmark '{}' must be a list of tasks", name);
      return fail(Error::ParseError);
    }
    if (root.size() == 0) {
      log::error("Benchmark '{}' has no tasks", name);
      return fail(Error::ParseError);
    }

    BenchmarkDefinition benchmark{.name = std::string{name}, .tasks = {}};
    std::unordered_set<std::string> seen;
    for (const auto& node : root) {
      auto task = node.as<TaskDefinition>();
      if (task.name.empty()) {
        log::error("Benchmark '{}' has a task without a name", name);
        return fail(Error::ParseError);
      }
      if (task.folds < 1) {
        log::error("Task '{}' in benchmark '{}' must have at least one fold",
                   task.name, name);
        return fail(Error::ParseError);
      }
      if (!seen.insert(task.name).second) {
        log::error("Duplicate task '{}' in benchmark '{}'", task.name, name);
        return fail(Error::ParseError);
      }
      benchmark.tasks.push_back(std::move(task));
    }
    return ok(std::move(benchmark));
  } catch (const YAML::Exception& e) {
    log::error("Failed to parse benchmark '{}': {}", name, e.what());
    return fail(Error::ParseError);
  }
}

auto FileDefinitionResolver::load_frameworks()
    -> Result<std::vector<FrameworkDefinition>> {
  auto content = read_file(frameworks_file_);
  if (!content) {
    return fail(content.error());
  }
  return parse_frameworks(*content);
}

auto FileDefinitionResolver::framework(std::string_view name)
    -> Result<FrameworkDefinition> {
  auto frameworks = load_frameworks();
  if (!frameworks) {
    return fail(frameworks.error());
  }

  auto it = std::ranges::find_if(*frameworks, [&](const auto& def) {
    return iequals(def.name, name);
  });
  if (it == frameworks->end()) {
    log::error("Framework '{}' is not defined in {}", name,
               frameworks_file_.string());
    return fail(Error::NotFound);
  }
  return ok(std::move(*it));
}

auto FileDefinitionResolver::list_frameworks()
    -> Result<std::vector<std::string>> {
  auto frameworks = load_frameworks();
  if (!frameworks) {
    return fail(frameworks.error());
  }
  std::vector<std::string> names;
  names.reserve(frameworks->size());
  for (auto& def : *frameworks) {
    names.push_back(std::move(def.name));
  }
  return ok(std::move(names));
}

auto FileDefinitionResolver::benchmark(std::string_view name)
    -> Result<BenchmarkDefinition> {
  for (const char* ext : {".yaml", ".yml"}) {
    auto path = benchmarks_dir_ / (std::string{name} + ext);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      continue;
    }
    auto content = read_file(path);
    if (!content) {
      return fail(content.error());
    }
    return parse_benchmark(name, *content);
  }
  log::error("Benchmark '{}' not found in {}", name, benchmarks_dir_.string());
  return fail(Error::NotFound);
}

}  // namespace benchdock
