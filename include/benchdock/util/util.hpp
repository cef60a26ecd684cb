#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace benchdock {

[[nodiscard]] inline auto to_lower(std::string_view s) -> std::string {
  std::string out{s};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

[[nodiscard]] inline auto iequals(std::string_view a, std::string_view b)
    -> bool {
  return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
    return std::tolower(x) == std::tolower(y);
  });
}

template <typename Range>
[[nodiscard]] auto join(const Range& items, std::string_view sep)
    -> std::string {
  std::string out;
  bool first = true;
  for (const auto& item : items) {
    if (!first) {
      out.append(sep);
    }
    std::format_to(std::back_inserter(out), "{}", item);
    first = false;
  }
  return out;
}

// Single-quotes `arg` for /bin/sh unless it only holds characters the shell
// passes through unchanged.
[[nodiscard]] inline auto shell_quote(std::string_view arg) -> std::string {
  constexpr std::string_view safe = "_-./:=@,+%";
  bool plain = !arg.empty() && std::ranges::all_of(arg, [&](unsigned char c) {
    return std::isalnum(c) || safe.find(static_cast<char>(c)) !=
                                  std::string_view::npos;
  });
  if (plain) {
    return std::string{arg};
  }
  std::string out = "'";
  for (char c : arg) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

[[nodiscard]] inline auto shell_join(const std::vector<std::string>& args)
    -> std::string {
  std::string out;
  for (const auto& arg : args) {
    if (!out.empty()) {
      out += ' ';
    }
    out += shell_quote(arg);
  }
  return out;
}

[[nodiscard]] inline auto to_millis(std::chrono::system_clock::time_point tp)
    -> std::int64_t {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

[[nodiscard]] inline auto from_millis(std::int64_t ms)
    -> std::chrono::system_clock::time_point {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

inline auto format_timestamp(std::chrono::system_clock::time_point tp)
    -> std::string {
  auto time = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

}  // namespace benchdock
