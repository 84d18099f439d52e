#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <utility>

namespace conduit {

// Base exception of the library. The message is stored inline (no heap allocation), formatted lazily at
// construction time with fmt and truncated with a trailing "..." when it does not fit.
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 111;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::copy_n(str, N, _data);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmt, Args&&... args) {
    const auto res = fmt::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      std::fill_n(_data + kMsgMaxLen - 3, 3, '.');
      _data[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace conduit
