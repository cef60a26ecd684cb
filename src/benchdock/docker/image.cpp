#include "benchdock/docker/image.hpp"

#include "benchdock/util/util.hpp"

#include <format>
#include <regex>

namespace benchdock::docker {

namespace {

auto trim(std::string_view s) -> std::string_view {
  constexpr std::string_view ws = " \t\r\n";
  auto first = s.find_first_not_of(ws);
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = s.find_last_not_of(ws);
  return s.substr(first, last - first + 1);
}

}  // namespace

auto image_reference(const FrameworkDefinition& framework) -> std::string {
  const auto& di = framework.docker_image;
  auto image = di.image && !di.image->empty() ? *di.image
                                              : to_lower(framework.name);
  return std::format("{}/{}:{}", di.author, image, di.tag);
}

auto is_image_id(std::string_view output) -> bool {
  static const std::regex image_id_pattern{"[0-9a-f]+"};
  auto id = trim(output);
  return std::regex_match(id.begin(), id.end(), image_id_pattern);
}

}  // namespace benchdock::docker
