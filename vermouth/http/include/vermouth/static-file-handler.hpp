#pragma once

#include <filesystem>
#include <string_view>

#include "vermouth/http-request.hpp"
#include "vermouth/response-context.hpp"

namespace vermouth {

// Serves files from a fixed root directory.
// The relative file path is taken from the 'filepath' route parameter (see Router::serveStatic),
// or from the request path when the route has no such parameter.
// Can be used as a Handler in Router.
class StaticFileHandler {
 public:
  static constexpr std::string_view kFilePathParam = "filepath";
  static constexpr std::string_view kDefaultIndex = "index.html";

  // Throws std::invalid_argument if 'rootDirectory' is not an existing directory.
  explicit StaticFileHandler(std::filesystem::path rootDirectory);

  // Answers 200 with the file content, or 404 for missing files and rejected paths.
  void operator()(HttpRequest& request, ResponseContext& response) const;

  // Maps a percent-encoded relative path to a file under the root.
  // Returns false if the path cannot be decoded, contains a '..' segment, or resolves outside of the root.
  // Directories resolve to their index.html.
  [[nodiscard]] bool resolveTarget(std::string_view encodedRelativePath, std::filesystem::path& resolvedPath) const;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return _root; }

 private:
  std::filesystem::path _root;
};

}  // namespace vermouth
