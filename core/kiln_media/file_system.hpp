// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef KILN_FILE_SYSTEM_HPP
#define KILN_FILE_SYSTEM_HPP

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace kiln {
namespace media {

/**
 * Filesystem operations used by staging and transcode output handling.
 * Allows cleanup failures to be simulated in tests.
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::string& path) const = 0;

  /**
   * Open a file for binary reading
   * @return nullptr if the file cannot be opened
   */
  virtual std::unique_ptr<std::istream> open_read(const std::string& path) const = 0;

  /**
   * Remove a single file
   * @return true if the file is gone afterwards
   */
  virtual bool remove(const std::string& path) const = 0;

  /**
   * Remove a directory tree
   * @return true if the tree is gone afterwards
   */
  virtual bool remove_all(const std::string& path) const = 0;

  virtual bool create_directories(const std::string& path) const = 0;

  /**
   * Write `data` to `path`, truncating any existing file
   */
  virtual bool write_file(const std::string& path, const std::string& data) const = 0;

  virtual bool copy_file(const std::string& from, const std::string& to) const = 0;

  /**
   * Regular files directly inside `dir` (names only, sorted)
   * @return false if the directory cannot be read completely
   */
  virtual bool list_files(const std::string& dir, std::vector<std::string>& names) const = 0;
};

/**
 * std::filesystem backed implementation
 */
class LocalFileSystem : public IFileSystem {
public:
  bool exists(const std::string& path) const override;
  std::unique_ptr<std::istream> open_read(const std::string& path) const override;
  bool remove(const std::string& path) const override;
  bool remove_all(const std::string& path) const override;
  bool create_directories(const std::string& path) const override;
  bool write_file(const std::string& path, const std::string& data) const override;
  bool copy_file(const std::string& from, const std::string& to) const override;
  bool list_files(const std::string& dir, std::vector<std::string>& names) const override;
};

std::shared_ptr<IFileSystem> local_file_system();

}  // namespace media
}  // namespace kiln

#endif  // KILN_FILE_SYSTEM_HPP
