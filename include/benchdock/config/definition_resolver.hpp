#pragma once

#include "benchdock/config/definitions.hpp"
#include "benchdock/core/error.hpp"

#include <filesystem>
#include <string_view>
#include <vector>

namespace benchdock {

class IDefinitionResolver {
public:
  virtual ~IDefinitionResolver() = default;

  [[nodiscard]] virtual auto framework(std::string_view name)
      -> Result<FrameworkDefinition> = 0;
  [[nodiscard]] virtual auto benchmark(std::string_view name)
      -> Result<BenchmarkDefinition> = 0;
};

// Reads framework definitions from a single YAML map keyed by framework name
// and benchmarks from `<benchmarks_dir>/<name>.yaml` (a list of tasks).
class FileDefinitionResolver : public IDefinitionResolver {
public:
  FileDefinitionResolver(std::filesystem::path frameworks_file,
                         std::filesystem::path benchmarks_dir);

  [[nodiscard]] auto framework(std::string_view name)
      -> Result<FrameworkDefinition> override;
  [[nodiscard]] auto benchmark(std::string_view name)
      -> Result<BenchmarkDefinition> override;

  [[nodiscard]] auto list_frameworks() -> Result<std::vector<std::string>>;

  [[nodiscard]] static auto parse_frameworks(std::string_view yaml_str)
      -> Result<std::vector<FrameworkDefinition>>;
  [[nodiscard]] static auto parse_benchmark(std::string_view name,
                                            std::string_view yaml_str)
      -> Result<BenchmarkDefinition>;

private:
  [[nodiscard]] auto load_frameworks()
      -> Result<std::vector<FrameworkDefinition>>;

  std::filesystem::path frameworks_file_;
  std::filesystem::path benchmarks_dir_;
};

}  // namespace benchdock
