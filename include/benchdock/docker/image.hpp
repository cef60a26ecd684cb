#pragma once

#include "benchdock/config/definitions.hpp"

#include <string>
#include <string_view>

namespace benchdock::docker {

// "{author}/{image}:{tag}", image defaulting to the lower-cased framework
// name. Recomputed on every call.
[[nodiscard]] auto image_reference(const FrameworkDefinition& framework)
    -> std::string;

// True only when the trimmed output of an image query is a single hexadecimal
// image id. Anything else, including empty output, means "no such image".
[[nodiscard]] auto is_image_id(std::string_view output) -> bool;

}  // namespace benchdock::docker
