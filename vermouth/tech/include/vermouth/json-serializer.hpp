#pragma once

#ifdef VERMOUTH_ENABLE_GLAZE

#include <glaze/glaze.hpp>  // IWYU pragma: export
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vermouth {

/// Serialize a C++ object to a JSON string using glaze.
/// Returns std::nullopt if glaze reports an encoding error.
/// Example usage:
///   struct Message { std::string text; };
///   template<> struct glz::meta<Message> { ... };
///   auto jsonStr = vermouth::SerializeToJson(msg);
template <typename T>
[[nodiscard]] std::optional<std::string> SerializeToJson(const T& obj) {
  auto result = glz::write_json(obj);
  if (!result) {
    return std::nullopt;
  }
  return std::move(*result);
}

/// Parse 'json' into 'out' using glaze. Returns false on syntax or schema error.
template <typename T>
[[nodiscard]] bool DeserializeFromJson(std::string_view json, T& out) {
  // glaze reads from a null-terminated buffer by default
  const std::string buffer(json);
  const auto ec = glz::read_json(out, buffer);
  return !ec;
}

}  // namespace vermouth

#endif  // VERMOUTH_ENABLE_GLAZE
