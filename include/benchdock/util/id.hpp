#pragma once

#include <compare>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <random>
#include <string>
#include <string_view>

namespace benchdock {

// Phantom type tags for type-safe ID disambiguation
struct JobTag {};
struct RunTag {};

template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using JobId = TypedId<JobTag>;
using RunId = TypedId<RunTag>;

namespace detail {
inline auto generate_short_uuid() -> std::string {
  thread_local std::random_device rd;
  thread_local std::mt19937_64 gen(rd());
  thread_local std::uniform_int_distribution<std::uint32_t> dis;
  return std::format("{:08x}", dis(gen));
}
}  // namespace detail

inline auto generate_run_id(std::string_view framework,
                            std::string_view benchmark) -> RunId {
  return RunId{std::format("{}_{}_{}", framework, benchmark,
                           detail::generate_short_uuid())};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace benchdock

template <typename Tag>
struct std::hash<benchdock::TypedId<Tag>> {
  auto operator()(const benchdock::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<benchdock::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const benchdock::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
