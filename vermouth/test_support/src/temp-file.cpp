#include "vermouth/temp-file.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "vermouth/log.hpp"

namespace vermouth::test {

namespace {

std::string ToHex(uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int pos = 15; pos >= 0; --pos) {
    out[static_cast<std::size_t>(pos)] = kHex[value & 0xF];
    value >>= 4;
  }
  return out;
}

uint64_t RandomValue() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return std::uniform_int_distribution<uint64_t>{}(engine);
}

}  // namespace

ScopedTempDir::ScopedTempDir(std::string_view prefix) {
  const auto base = std::filesystem::temp_directory_path();
  for (int attempt = 0; attempt < 100; ++attempt) {
    auto candidate = base / (std::string(prefix) + ToHex(RandomValue()));
    std::error_code ec;
    if (std::filesystem::create_directory(candidate, ec)) {
      _dir = std::move(candidate);
      return;
    }
  }
  throw std::runtime_error("ScopedTempDir: failed to create a temporary directory");
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : _dir(std::move(other._dir)) { other._dir.clear(); }

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept {
  if (this != &other) {
    cleanup();
    _dir = std::move(other._dir);
    other._dir.clear();
  }
  return *this;
}

ScopedTempDir::~ScopedTempDir() { cleanup(); }

std::filesystem::path ScopedTempDir::makeSubDir(std::string_view relativePath) const {
  auto subDir = _dir / relativePath;
  std::filesystem::create_directories(subDir);
  return subDir;
}

void ScopedTempDir::cleanup() noexcept {
  if (_dir.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove_all(_dir, ec);
  if (ec) {
    log::warn("Unable to remove temporary directory '{}': {}", _dir.string(), ec.message());
  }
  _dir.clear();
}

ScopedTempFile::ScopedTempFile(const ScopedTempDir& dir, std::string_view name, std::string_view content)
    : _path(dir.dirPath() / name) {
  std::filesystem::create_directories(_path.parent_path());
  std::ofstream ofs(_path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    throw std::runtime_error("ScopedTempFile: unable to create '" + _path.string() + "'");
  }
  ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
  if (!ofs) {
    throw std::runtime_error("ScopedTempFile: unable to write '" + _path.string() + "'");
  }
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept : _path(std::move(other._path)) {
  other._path.clear();
}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& other) noexcept {
  if (this != &other) {
    cleanup();
    _path = std::move(other._path);
    other._path.clear();
  }
  return *this;
}

ScopedTempFile::~ScopedTempFile() { cleanup(); }

void ScopedTempFile::cleanup() noexcept {
  if (_path.empty()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(_path, ec);
  if (ec) {
    log::warn("Unable to remove temporary file '{}': {}", _path.string(), ec.message());
  }
  _path.clear();
}

}  // namespace vermouth::test
