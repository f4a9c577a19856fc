// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "file_system.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace kiln {
namespace media {

namespace fs = std::filesystem;

bool LocalFileSystem::exists(const std::string& path) const {
  std::error_code ec;
  return fs::exists(path, ec);
}

std::unique_ptr<std::istream> LocalFileSystem::open_read(const std::string& path) const {
  auto in = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!in->is_open()) {
    return nullptr;
  }
  return in;
}

bool LocalFileSystem::remove(const std::string& path) const {
  std::error_code ec;
  fs::remove(path, ec);
  return !ec && !fs::exists(path, ec);
}

bool LocalFileSystem::remove_all(const std::string& path) const {
  std::error_code ec;
  fs::remove_all(path, ec);
  return !ec && !fs::exists(path, ec);
}

bool LocalFileSystem::create_directories(const std::string& path) const {
  std::error_code ec;
  fs::create_directories(path, ec);
  return !ec && fs::is_directory(path, ec);
}

bool LocalFileSystem::write_file(const std::string& path, const std::string& data) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(data.data(), static_cast<std::streamsize>(data.size()));
  out.close();
  return !out.fail();
}

bool LocalFileSystem::copy_file(const std::string& from, const std::string& to) const {
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  return !ec;
}

bool LocalFileSystem::list_files(const std::string& dir, std::vector<std::string>& names) const {
  names.clear();
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const bool regular = it->is_regular_file(ec);
    if (ec) {
      break;
    }
    if (regular) {
      names.push_back(it->path().filename().string());
    }
  }
  if (ec) {
    names.clear();
    return false;
  }
  std::sort(names.begin(), names.end());
  return true;
}

std::shared_ptr<IFileSystem> local_file_system() {
  static std::shared_ptr<IFileSystem> instance = std::make_shared<LocalFileSystem>();
  return instance;
}

}  // namespace media
}  // namespace kiln
