#include "vermouth/form-values.hpp"

#include <algorithm>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "vermouth/url-decode.hpp"

namespace vermouth {

std::optional<FormValues> FormValues::Parse(std::string_view encoded) {
  FormValues values;
  while (!encoded.empty()) {
    const auto ampPos = encoded.find('&');
    const std::string_view pair = encoded.substr(0, ampPos);
    encoded.remove_prefix(ampPos == std::string_view::npos ? encoded.size() : ampPos + 1);
    if (pair.empty()) {
      continue;
    }

    const auto eqPos = pair.find('=');
    auto key = url::Decode(pair.substr(0, eqPos), ' ');
    auto value = url::Decode(eqPos == std::string_view::npos ? std::string_view{} : pair.substr(eqPos + 1), ' ');
    if (!key || !value) {
      return std::nullopt;
    }
    values._entries.emplace_back(std::move(*key), std::move(*value));
  }
  return values;
}

std::optional<std::string_view> FormValues::get(std::string_view key) const noexcept {
  auto it = std::ranges::find_if(_entries, [key](const Entry& entry) { return entry.first == key; });
  if (it == _entries.end()) {
    return std::nullopt;
  }
  return std::string_view(it->second);
}

std::vector<std::string_view> FormValues::getAll(std::string_view key) const {
  std::vector<std::string_view> result;
  for (const auto& [entryKey, entryValue] : _entries) {
    if (entryKey == key) {
      result.emplace_back(entryValue);
    }
  }
  return result;
}

}  // namespace vermouth
