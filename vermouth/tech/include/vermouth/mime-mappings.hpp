#pragma once

#include <string_view>

namespace vermouth {

struct MIMEMapping {
  std::string_view extension;
  std::string_view mimeType;
};

// Sorted by extension (checked at compile time in mime-mappings.cpp).
inline constexpr MIMEMapping kMIMEMappings[] = {
    {"avif", "image/avif"},
    {"bmp", "image/bmp"},
    {"css", "text/css"},
    {"csv", "text/csv"},
    {"gif", "image/gif"},
    {"gz", "application/gzip"},
    {"htm", "text/html"},
    {"html", "text/html"},
    {"ico", "image/x-icon"},
    {"jpeg", "image/jpeg"},
    {"jpg", "image/jpeg"},
    // RFC 9239 makes text/javascript the recommended media type for JavaScript.
    {"js", "text/javascript"},
    {"json", "application/json"},
    {"map", "application/json"},
    {"md", "text/markdown"},
    {"mjs", "text/javascript"},
    {"mp3", "audio/mpeg"},
    {"mp4", "video/mp4"},
    {"otf", "font/otf"},
    {"pdf", "application/pdf"},
    {"png", "image/png"},
    {"svg", "image/svg+xml"},
    {"tar", "application/x-tar"},
    {"ttf", "font/ttf"},
    {"txt", "text/plain"},
    {"wasm", "application/wasm"},
    {"webm", "video/webm"},
    {"webp", "image/webp"},
    {"woff", "font/woff"},
    {"woff2", "font/woff2"},
    {"xml", "application/xml"},
    {"zip", "application/zip"},
};

// Given a file path, determine the appropriate MIME type from its extension (case insensitive).
// Returns an empty string_view if the extension is unknown or absent.
std::string_view DetermineMIMETypeStr(std::string_view path);

}  // namespace vermouth
