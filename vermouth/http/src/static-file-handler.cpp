#include "vermouth/static-file-handler.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "vermouth/http-request.hpp"
#include "vermouth/http-status-code.hpp"
#include "vermouth/log.hpp"
#include "vermouth/response-context.hpp"
#include "vermouth/url-decode.hpp"

namespace vermouth {

namespace {

bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& candidate) {
  const auto rootIt = std::mismatch(root.begin(), root.end(), candidate.begin(), candidate.end()).first;
  return rootIt == root.end();
}

}  // namespace

StaticFileHandler::StaticFileHandler(std::filesystem::path rootDirectory) : _root(std::move(rootDirectory)) {
  std::error_code ec;
  _root = std::filesystem::weakly_canonical(_root, ec);
  if (ec) {
    _root = std::filesystem::absolute(_root);
  }
  if (!std::filesystem::is_directory(_root, ec)) {
    throw std::invalid_argument("StaticFileHandler root must be an existing directory: '" + _root.string() + "'");
  }
}

bool StaticFileHandler::resolveTarget(std::string_view encodedRelativePath, std::filesystem::path& resolvedPath) const {
  // '+' is a literal character in paths
  auto decoded = url::Decode(encodedRelativePath, '+');
  if (!decoded) {
    log::debug("Static path '{}' has an invalid percent escape", encodedRelativePath);
    return false;
  }
  std::string_view rawPath(*decoded);
  if (rawPath.find('\0') != std::string_view::npos) {
    return false;
  }

  std::filesystem::path relative;
  while (!rawPath.empty()) {
    const auto slashPos = rawPath.find('/');
    const auto segment = rawPath.substr(0, slashPos);
    if (!segment.empty() && segment != ".") {
      if (segment == "..") {
        log::warn("Rejected static path with a traversal segment '{}'", encodedRelativePath);
        return false;
      }
      relative /= std::filesystem::path(segment);
    }
    if (slashPos == std::string_view::npos) {
      break;
    }
    rawPath.remove_prefix(slashPos + 1);
  }

  resolvedPath = _root / relative;
  std::error_code ec;
  if (std::filesystem::is_directory(resolvedPath, ec)) {
    resolvedPath /= kDefaultIndex;
  }

  // symbolic links may still point outside of the root
  const auto canonical = std::filesystem::weakly_canonical(resolvedPath, ec);
  if (ec || !IsWithin(_root, canonical)) {
    log::warn("Rejected static path escaping the root '{}'", encodedRelativePath);
    return false;
  }
  return true;
}

void StaticFileHandler::operator()(HttpRequest& request, ResponseContext& response) const {
  const auto captured = request.pathParams().find(kFilePathParam);
  const std::string_view relativePath = captured ? *captured : request.path();

  std::filesystem::path resolvedPath;
  if (!resolveTarget(relativePath, resolvedPath)) {
    response.notFound();
    return;
  }
  if (!response.file(http::StatusCodeOK, resolvedPath.string())) {
    response.notFound();
  }
}

}  // namespace vermouth
