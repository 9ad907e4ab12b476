#include "file_store.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <future>
#include <thread>
#include "config.hpp"
#include "posix_fd.hpp"

static void split_range(const char* data, size_t start, size_t end, std::vector<std::string>& out) {
  for (size_t i = start; i < end; ++i) {
    if (data[i] == '\n') {
      size_t e = i;
      if (e > start && data[e - 1] == '\r') e--;
      out.emplace_back(data + start, e - start);
      start = i + 1;
    }
  }
  size_t e = end;
  if (e > start && data[e - 1] == '\r') e--;
  out.emplace_back(data + start, e - start);
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string() + " (" + std::strerror(errno) + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out_lines.emplace_back(""); msg = std::string("opened file: ") + path.string(); return true; }
  MappedRegion region(fd.get(), n);
  if (!region.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = region.data();

  unsigned hw = std::thread::hardware_concurrency();
  if (hw == 0) hw = 4;
  const size_t min_parallel_size = 1 << 20;
  if (n < min_parallel_size || hw == 1) {
    split_range(data, 0, n, out_lines);
  } else {
    /* cut at newlines so every chunk holds whole lines, then split chunks concurrently */
    unsigned threads = std::max(2u, std::min<unsigned>(hw, static_cast<unsigned>(n / min_parallel_size)));
    std::vector<size_t> cuts{0};
    for (unsigned t = 1; t < threads; ++t) {
      size_t p = std::max(cuts.back(), t * (n / threads));
      const void* nl = std::memchr(data + p, '\n', n - p);
      if (!nl) break;
      cuts.push_back(static_cast<size_t>(static_cast<const char*>(nl) - data) + 1);
    }
    cuts.push_back(n + 1);
    std::vector<std::vector<std::string>> parts(cuts.size() - 1);
    std::vector<std::future<void>> futs;
    for (size_t t = 0; t + 1 < cuts.size(); ++t) {
      size_t s = cuts[t];
      size_t e = cuts[t + 1] - 1;  /* excludes the newline that ends the chunk */
      futs.emplace_back(std::async(std::launch::async, [&, s, e, t]{ split_range(data, s, e, parts[t]); }));
    }
    for (auto& f : futs) f.get();
    for (auto& p : parts) {
      for (auto& l : p) out_lines.push_back(std::move(l));
    }
  }
  if (out_lines.empty()) out_lines.emplace_back("");
  msg = std::string("opened file: ") + path.string();
  return true;
}

bool PosixFileStore::exists(const std::filesystem::path& path) const {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

bool PosixFileStore::read_lines(const std::filesystem::path& path, std::vector<std::string>& out_lines, std::string& msg) {
  return mmap_readlines(path, out_lines, msg);
}

bool PosixFileStore::write(const std::filesystem::path& path, std::string_view content, std::string& msg) {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  const char* p = content.data();
  size_t remain = content.size();
  while (remain > 0) {
    size_t chunk = std::min<size_t>(remain, SCRIBE_WRITE_CHUNK_SIZE);
    ssize_t w = ::write(ufd.get(), p, chunk);
    if (w < 0) {
      if (errno == EINTR) continue;
      msg = std::string("write file failed: ") + tmp.string();
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}

bool PosixFileStore::list(const std::filesystem::path& dir, std::vector<std::string>& files, std::vector<std::string>& dirs, std::string& msg) {
  files.clear();
  dirs.clear();
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) { msg = std::string("can not list directory: ") + dir.string(); return false; }
  for (const auto& entry : it) {
    std::string name = entry.path().filename().string();
    std::error_code tec;
    if (entry.is_directory(tec)) dirs.push_back(name);
    else if (entry.is_regular_file(tec)) files.push_back(name);
  }
  std::sort(files.begin(), files.end());
  std::sort(dirs.begin(), dirs.end());
  return true;
}
