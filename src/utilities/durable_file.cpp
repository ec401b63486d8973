#include "utilities/durable_file.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace docforensics {

namespace {
Result<void> ioFailure(const std::string &what, const std::string &path) {
  return Result<void>::failure(ErrorKind::PersistenceError,
                               what + " " + path + ": " + std::strerror(errno));
}
} // namespace

Result<void> writeFileDurably(const std::string &path, const std::string &data) {
  namespace fs = std::filesystem;
  fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      return Result<void>::failure(ErrorKind::PersistenceError,
                                   "create_directories " +
                                       target.parent_path().string() + ": " +
                                       ec.message());
    }
  }

  const std::string tmp = path + ".tmp";
  int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0)
    return ioFailure("open", tmp);

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      auto failure = ioFailure("write", tmp);
      ::close(fd);
      ::unlink(tmp.c_str());
      return failure;
    }
    written += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    auto failure = ioFailure("fsync", tmp);
    ::close(fd);
    ::unlink(tmp.c_str());
    return failure;
  }
  if (::close(fd) != 0) {
    auto failure = ioFailure("close", tmp);
    ::unlink(tmp.c_str());
    return failure;
  }
  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    auto failure = ioFailure("rename", tmp);
    ::unlink(tmp.c_str());
    return failure;
  }

  std::string dir =
      target.has_parent_path() ? target.parent_path().string() : ".";
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd >= 0) {
    ::fsync(dfd);
    ::close(dfd);
  }
  return Result<void>::success();
}

Result<void> appendFileDurably(const std::string &path, const std::string &data) {
  int fd = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CLOEXEC);
  if (fd < 0)
    return ioFailure("open", path);

  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    auto failure = ioFailure("fstat", path);
    ::close(fd);
    return failure;
  }

  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      auto failure = ioFailure("write", path);
      if (::ftruncate(fd, st.st_size) != 0)
        failure = ioFailure("write (and truncate)", path);
      ::close(fd);
      return failure;
    }
    written += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0) {
    auto failure = ioFailure("fsync", path);
    ::close(fd);
    return failure;
  }
  if (::close(fd) != 0)
    return ioFailure("close", path);
  return Result<void>::success();
}

Result<std::string> readWholeFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return Result<std::string>::failure(ErrorKind::PersistenceError,
                                        "Could not open " + path);
  }
  std::ostringstream oss;
  oss << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorKind::PersistenceError,
                                        "Read error on " + path);
  }
  return oss.str();
}

} // namespace docforensics
