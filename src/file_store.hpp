#pragma once
/*
 * FileStore
 *
 * Purpose: file I/O collaborator (read/write/list) behind an interface so the
 *          editor can be driven against an in-memory store in tests.
 * PosixFileStore: mmap reading with CRLF normalization; safe writes
 *          (write .tmp -> fdatasync -> atomic rename).
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

class IFileStore {
public:
  virtual ~IFileStore() = default;
  virtual bool exists(const std::filesystem::path& path) const = 0;
  virtual bool read_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg) = 0;
  virtual bool write(const std::filesystem::path& path, std::string_view content, std::string& msg) = 0;
  /* entries sorted by name; dirs without trailing slash */
  virtual bool list(const std::filesystem::path& dir, std::vector<std::string>& files, std::vector<std::string>& dirs, std::string& msg) = 0;
};

class PosixFileStore : public IFileStore {
public:
  bool exists(const std::filesystem::path& path) const override;
  bool read_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg) override;
  bool write(const std::filesystem::path& path, std::string_view content, std::string& msg) override;
  bool list(const std::filesystem::path& dir, std::vector<std::string>& files, std::vector<std::string>& dirs, std::string& msg) override;
};

bool mmap_readlines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg);
