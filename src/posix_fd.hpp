#pragma once
/*
 * PosixFd
 *
 * Purpose: RAII owners for the raw POSIX resources the file store touches.
 * UniqueFd closes its descriptor; MappedRegion unmaps a read-only mapping.
 */
#include <sys/mman.h>
#include <unistd.h>
#include <cstddef>
#include <string_view>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { reset(other.fd_); other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) ::close(fd_);
    fd_ = fd;
  }
private:
  int fd_;
};

class MappedRegion {
public:
  /* maps the first size bytes of fd read-only; check valid() */
  MappedRegion(int fd, size_t size) : size_(size) {
    void* mem = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
    if (mem != MAP_FAILED) {
      data_ = static_cast<const char*>(mem);
      (void)::madvise(mem, size, MADV_SEQUENTIAL);
    }
  }
  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;
  ~MappedRegion() {
    if (data_) ::munmap(const_cast<char*>(data_), size_);
  }
  bool valid() const { return data_ != nullptr; }
  const char* data() const { return data_; }
  size_t size() const { return size_; }
  std::string_view view() const { return std::string_view(data_, size_); }
private:
  const char* data_ = nullptr;
  size_t size_;
};
