#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vermouth {

struct PathParamCapture {
  std::string key;
  std::string value;

  bool operator==(const PathParamCapture&) const noexcept = default;
};

// Values captured by a route pattern for one request, in pattern order.
// Each successful match produces its own instance, never shared between requests.
class PathParams {
 public:
  using const_iterator = std::vector<PathParamCapture>::const_iterator;

  // Adds a capture. An existing capture with the same key is overwritten.
  void set(std::string_view key, std::string_view value);

  // Returns the captured value for 'key', or std::nullopt if the pattern has no such parameter.
  [[nodiscard]] std::optional<std::string_view> find(std::string_view key) const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return _captures.size(); }

  [[nodiscard]] bool empty() const noexcept { return _captures.empty(); }

  void clear() noexcept { _captures.clear(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _captures.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _captures.end(); }

  bool operator==(const PathParams&) const noexcept = default;

 private:
  std::vector<PathParamCapture> _captures;
};

}  // namespace vermouth
