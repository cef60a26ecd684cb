#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace benchdock {

enum class Error : int {
  Success,
  FileNotFound,
  FileOpenFailed,
  FileWriteFailed,
  ParseError,
  InvalidArgument,
  NotFound,
  ProcessSpawnFailed,
  ImageBuildFailed,
  ImagePushFailed,
  ContainerRunFailed,
  DatabaseOpenFailed,
  DatabaseQueryFailed,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::string_view messages[] = {
      "success",
      "file not found",
      "failed to open file",
      "failed to write file",
      "parse error",
      "invalid argument",
      "not found",
      "failed to spawn process",
      "container image build failed",
      "container image publish failed",
      "container run failed",
      "failed to open database",
      "database query failed",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char* override {
    return "benchdock";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages[idx]};
  }
};

inline auto error_category() -> const ErrorCategory& {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
using Result = std::expected<T, std::error_code>;

template <typename T>
[[nodiscard]] constexpr auto ok(T&& value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> {
  return {};
}

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

}  // namespace benchdock

template <>
struct std::is_error_code_enum<benchdock::Error> : std::true_type {};
