#include "local_fs.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace local_fs {

namespace fs = std::filesystem;

namespace {

std::string errno_message(int err) { return std::strerror(err); }

class PosixWritableFile : public WritableFile {
public:
  PosixWritableFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~PosixWritableFile() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  const std::string &path() const override { return path_; }

  bool write(const char *data, std::size_t len, std::string &err) override {
    if (fd_ < 0) {
      err = "file is closed";
      return false;
    }
    std::size_t done = 0;
    while (done < len) {
      const ssize_t n = ::write(fd_, data + done, len - done);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        err = errno_message(errno);
        return false;
      }
      done += static_cast<std::size_t>(n);
    }
    return true;
  }

  bool close(std::string &err) override {
    if (fd_ < 0) {
      return true;
    }
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) != 0) {
      err = errno_message(errno);
      return false;
    }
    return true;
  }

private:
  int fd_;
  std::string path_;
};

class PosixReadableFile : public ReadableFile {
public:
  PosixReadableFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}
  ~PosixReadableFile() override { ::close(fd_); }

  const std::string &path() const override { return path_; }

  int64_t read(char *buf, std::size_t cap, std::string &err) override {
    while (true) {
      const ssize_t n = ::read(fd_, buf, cap);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        err = errno_message(errno);
        return -1;
      }
      return static_cast<int64_t>(n);
    }
  }

private:
  int fd_;
  std::string path_;
};

} // namespace

std::unique_ptr<WritableFile>
PosixFileSystem::create_temp_file(const std::string &dir,
                                  const std::string &prefix, std::string &err) {
  std::error_code ec;
  fs::path base = dir.empty() ? fs::temp_directory_path(ec) : fs::path(dir);
  if (ec) {
    err = "cannot determine temp directory: " + ec.message();
    return nullptr;
  }
  base = fs::absolute(base, ec);
  if (ec) {
    err = "cannot resolve temp directory '" + dir + "': " + ec.message();
    return nullptr;
  }

  const std::string pattern = (base / (prefix + "XXXXXX")).string();
  std::vector<char> name(pattern.begin(), pattern.end());
  name.push_back('\0');

  const int fd = ::mkstemp(name.data());
  if (fd < 0) {
    err = "cannot create temp file in '" + base.string() +
          "': " + errno_message(errno);
    return nullptr;
  }
  return std::make_unique<PosixWritableFile>(fd, std::string(name.data()));
}

std::unique_ptr<ReadableFile> PosixFileSystem::open_read(const std::string &path,
                                                         std::string &err) {
  if (path.empty()) {
    err = "no path given";
    return nullptr;
  }
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    err = errno_message(errno);
    return nullptr;
  }

  struct stat st;
  if (::fstat(fd, &st) == 0 && S_ISDIR(st.st_mode)) {
    ::close(fd);
    err = "is a directory";
    return nullptr;
  }
  return std::make_unique<PosixReadableFile>(fd, path);
}

bool PosixFileSystem::remove(const std::string &path, std::string &err) {
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    err = errno_message(errno);
    return false;
  }
  return true;
}

TempFileGuard::~TempFileGuard() {
  if (armed_) {
    // Backstop only; failure paths call remove() and report errors
    std::string err;
    static_cast<void>(fs_.remove(path_, err));
  }
}

std::string TempFileGuard::release() {
  armed_ = false;
  return path_;
}

bool TempFileGuard::remove(std::string &err) {
  armed_ = false;
  return fs_.remove(path_, err);
}

} // namespace local_fs
