#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace st::typesys {

enum class ErrorKind {
  Transpile,
  Compile,
  Collision,
  Completeness,
  Bounds,
  IdParse,
  Decode,
  Layout,
};

inline auto to_string(ErrorKind kind) -> std::string_view {
  switch (kind) {
    case ErrorKind::Transpile:
      return "transpile";
    case ErrorKind::Compile:
      return "compile";
    case ErrorKind::Collision:
      return "collision";
    case ErrorKind::Completeness:
      return "completeness";
    case ErrorKind::Bounds:
      return "bounds";
    case ErrorKind::IdParse:
      return "id parse";
    case ErrorKind::Decode:
      return "decode";
    case ErrorKind::Layout:
      return "layout";
  }
  return "unknown";
}

struct TypeError {
  ErrorKind kind = ErrorKind::Compile;
  std::string message;

  auto to_string() const -> std::string {
    return std::string(typesys::to_string(kind)) + " error: " + message;
  }
};

using ErrorList = std::vector<TypeError>;

template <typename T>
using Expected = tl::expected<T, TypeError>;

/// Result of a builder stage which reports every independent problem at once.
template <typename T>
using ExpectedAll = tl::expected<T, ErrorList>;

inline auto make_error(ErrorKind kind, std::string message) -> TypeError {
  return TypeError{kind, std::move(message)};
}

}  // namespace st::typesys
