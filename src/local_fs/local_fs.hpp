#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace local_fs {

// Append-only handle on a freshly created file.
class WritableFile {
public:
  virtual ~WritableFile() = default;

  virtual const std::string &path() const = 0;

  // Writes all len bytes. Returns false and sets err on failure.
  virtual bool write(const char *data, std::size_t len, std::string &err) = 0;

  // Flushes and closes. Idempotent; returns false and sets err on failure.
  virtual bool close(std::string &err) = 0;
};

class ReadableFile {
public:
  virtual ~ReadableFile() = default;

  virtual const std::string &path() const = 0;

  // Returns bytes read (0 at EOF) or -1 with err set.
  virtual int64_t read(char *buf, std::size_t cap, std::string &err) = 0;
};

class FileSystem {
public:
  virtual ~FileSystem() = default;

  // Creates a new uniquely named file "<dir>/<prefix>XXXXXX" (mode 0600).
  // An empty dir means the system temp directory. Returns nullptr and sets
  // err on failure.
  virtual std::unique_ptr<WritableFile>
  create_temp_file(const std::string &dir, const std::string &prefix,
                   std::string &err) = 0;

  // Opens an existing file read-only. Returns nullptr and sets err on failure.
  virtual std::unique_ptr<ReadableFile> open_read(const std::string &path,
                                                  std::string &err) = 0;

  virtual bool remove(const std::string &path, std::string &err) = 0;
};

// POSIX implementation (mkstemp/open/read/write/close/unlink).
class PosixFileSystem : public FileSystem {
public:
  std::unique_ptr<WritableFile> create_temp_file(const std::string &dir,
                                                 const std::string &prefix,
                                                 std::string &err) override;
  std::unique_ptr<ReadableFile> open_read(const std::string &path,
                                          std::string &err) override;
  bool remove(const std::string &path, std::string &err) override;
};

// Removes the file at `path` on destruction unless released.
class TempFileGuard {
public:
  TempFileGuard(FileSystem &fs, std::string path)
      : fs_(fs), path_(std::move(path)) {}
  ~TempFileGuard();

  TempFileGuard(const TempFileGuard &) = delete;
  TempFileGuard &operator=(const TempFileGuard &) = delete;

  // Hands the file over to the caller; it will no longer be removed.
  std::string release();

  // Removes now. Returns false with err on failure (the guard is then spent).
  bool remove(std::string &err);

private:
  FileSystem &fs_;
  std::string path_;
  bool armed_ = true;
};

} // namespace local_fs
