#pragma once
/*
 * FileIO
 *
 * Purpose: whole-file reads via mmap, line splitting (CRLF normalized) and
 *          safe writes (write .tmp -> fsync/fdatasync -> atomic rename).
 * Usage: every call returns false and fills msg on failure.
 */
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  ~UniqueFd() { reset(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  // close() result, so callers can tell a failed flush on close
  int reset(int fd = -1) {
    int rc = 0;
    if (fd_ >= 0) rc = ::close(fd_);
    fd_ = fd;
    return rc;
  }
private:
  int fd_;
};

bool mmap_read_file(const std::filesystem::path& path, std::string& out, std::string& msg);
bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg);
bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg);
