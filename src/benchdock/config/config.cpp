#include "benchdock/config/config.hpp"

#include "benchdock/config/yaml_utils.hpp"
#include "benchdock/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<benchdock::LoggingConfig> {
  static bool decode(const Node& node, benchdock::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = benchdock::yaml_get_or<std::string>(node, "level", "info");
    l.file = benchdock::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<benchdock::RunConfiguration> {
  static bool decode(const Node& node, benchdock::RunConfiguration& r) {
    if (!node.IsMap()) {
      return false;
    }
    r.input_dir = benchdock::yaml_get_or<std::string>(node, "input_dir", "./input");
    r.output_dir = benchdock::yaml_get_or<std::string>(node, "output_dir", "./results");
    r.parallel_jobs = benchdock::yaml_get_or(node, "parallel_jobs", 1);
    r.max_parallel_jobs = benchdock::yaml_get_or(node, "max_parallel_jobs", 10);
    if (r.max_parallel_jobs < 1) {
      benchdock::log::error("run.max_parallel_jobs must be at least 1, got {}",
                            r.max_parallel_jobs);
      return false;
    }
    r.script = benchdock::yaml_get_or<std::string>(node, "script", "runbenchmark.py");
    auto partition = benchdock::yaml_get_or<std::string>(node, "partition", "fold");
    auto policy = benchdock::parse_partition_policy(partition);
    if (!policy) {
      benchdock::log::error("Unknown run.partition '{}' (expected task or fold)",
                            partition);
      return false;
    }
    r.partition = *policy;
    return true;
  }
};

template <>
struct convert<benchdock::DockerConfig> {
  static bool decode(const Node& node, benchdock::DockerConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.binary = benchdock::yaml_get_or<std::string>(node, "binary", "docker");
    d.build_context = benchdock::yaml_get_or<std::string>(node, "build_context", ".");
    d.frameworks_dir = benchdock::yaml_get_or<std::string>(node, "frameworks_dir", "frameworks");
    d.descriptor = benchdock::yaml_get_or<std::string>(node, "descriptor", "Dockerfile");
    return true;
  }
};

template <>
struct convert<benchdock::StorageConfig> {
  static bool decode(const Node& node, benchdock::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.db_file = benchdock::yaml_get_or<std::string>(node, "db_file", "benchdock.db");
    return true;
  }
};

template <>
struct convert<benchdock::DefinitionsConfig> {
  static bool decode(const Node& node, benchdock::DefinitionsConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.frameworks_file = benchdock::yaml_get_or<std::string>(
        node, "frameworks_file", "resources/frameworks.yaml");
    d.benchmarks_dir = benchdock::yaml_get_or<std::string>(
        node, "benchmarks_dir", "resources/benchmarks");
    return true;
  }
};

template <>
struct convert<benchdock::SystemConfig> {
  static bool decode(const Node& node, benchdock::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto logging = node["logging"]; logging && !logging.IsNull()) {
      c.logging = logging.as<benchdock::LoggingConfig>();
    }
    if (auto run = node["run"]; run && !run.IsNull()) {
      c.run = run.as<benchdock::RunConfiguration>();
    }
    if (auto docker = node["docker"]; docker && !docker.IsNull()) {
      c.docker = docker.as<benchdock::DockerConfig>();
    }
    if (auto storage = node["storage"]; storage && !storage.IsNull()) {
      c.storage = storage.as<benchdock::StorageConfig>();
    }
    if (auto definitions = node["definitions"]; definitions && !definitions.IsNull()) {
      c.definitions = definitions.as<benchdock::DefinitionsConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace benchdock {

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    SystemConfig config = root.as<SystemConfig>();
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace benchdock
