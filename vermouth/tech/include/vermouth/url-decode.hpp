#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vermouth::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' into
// 'plusAs'. Pass '+' to keep pluses verbatim (paths), ' ' for application/x-www-form-urlencoded.
// Returns a pointer to the new logical end of the decoded sequence, or nullptr on invalid encoding
// (truncated % or non-hex digits), leaving the buffer partially modified.
char* DecodeInPlace(char* first, char* last, char plusAs = '+');

// Returns a decoded copy of 'encoded', or std::nullopt if it contains an invalid escape.
std::optional<std::string> Decode(std::string_view encoded, char plusAs = '+');

}  // namespace vermouth::url
