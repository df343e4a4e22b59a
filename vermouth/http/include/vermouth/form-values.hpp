#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vermouth {

// Decoded application/x-www-form-urlencoded key/value pairs.
// Order and duplicates are preserved. '+' decodes to a space in both keys and values.
class FormValues {
 public:
  using Entry = std::pair<std::string, std::string>;
  using const_iterator = std::vector<Entry>::const_iterator;

  FormValues() noexcept = default;

  // Parses an urlencoded payload such as "a=1&b=two+words".
  //  - Missing '=' gives an empty value ("flag" -> {"flag", ""}).
  //  - Empty pairs ("a=1&&b=2") are skipped.
  // Returns std::nullopt if a key or value carries an invalid percent escape.
  [[nodiscard]] static std::optional<FormValues> Parse(std::string_view encoded);

  // First value associated to 'key', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept;

  // First value associated to 'key', or an empty string_view.
  [[nodiscard]] std::string_view getOrEmpty(std::string_view key) const noexcept { return get(key).value_or(""); }

  // All values associated to 'key', in order.
  [[nodiscard]] std::vector<std::string_view> getAll(std::string_view key) const;

  [[nodiscard]] bool contains(std::string_view key) const noexcept { return get(key).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _entries.size(); }

  [[nodiscard]] bool empty() const noexcept { return _entries.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _entries.begin(); }
  [[nodiscard]] const_iterator end() const noexcept { return _entries.end(); }

 private:
  std::vector<Entry> _entries;
};

}  // namespace vermouth
