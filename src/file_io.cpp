#include "file_io.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

static std::string errno_text() { return std::strerror(errno); }

bool mmap_read_file(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string() + " (" + errno_text() + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return true;
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file: " + path.string(); return false; }
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out.assign(static_cast<const char*>(mem), n);
  ::munmap(mem, n);
  return true;
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  std::string data;
  if (!mmap_read_file(path, data, msg)) return false;
  size_t start = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
    start = i + 1;
  }
  if (start < data.size()) {
    size_t end = data.size();
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
  }
  return true;
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) { msg = "can not create directory: " + path.parent_path().string(); return false; }
  }
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) { msg = "write file failed: " + tmp.string(); return false; }
  const char* p = data.data();
  size_t remain = data.size();
  while (remain > 0) {
    ssize_t w = ::write(ufd.get(), p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      msg = "write file failed: " + tmp.string() + " (" + errno_text() + ")";
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = "write file failed: " + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = "write file failed: " + tmp.string(); return false; }
#endif
  if (ufd.reset() != 0) { msg = "write file failed: " + tmp.string(); return false; }
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = "write file failed: " + path.string(); return false; }
  return true;
}
