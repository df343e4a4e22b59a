#include "vermouth/path-params.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace vermouth {

void PathParams::set(std::string_view key, std::string_view value) {
  auto it = std::ranges::find_if(_captures, [key](const PathParamCapture& capture) { return capture.key == key; });
  if (it != _captures.end()) {
    it->value.assign(value);
  } else {
    _captures.push_back(PathParamCapture{std::string(key), std::string(value)});
  }
}

std::optional<std::string_view> PathParams::find(std::string_view key) const noexcept {
  auto it = std::ranges::find_if(_captures, [key](const PathParamCapture& capture) { return capture.key == key; });
  if (it == _captures.end()) {
    return std::nullopt;
  }
  return std::string_view(it->value);
}

}  // namespace vermouth
