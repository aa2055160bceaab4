#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>
#include <system_error>

namespace util {

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // Reads at most max_bytes bytes of the file specified by path. If the file
  // is longer and truncated is not null, *truncated is set to true.
  static std::string Read(const std::string& path, size_t max_bytes,
                          bool* truncated = nullptr);

  // Writes contents to path atomically, going through a temporary file in the
  // same directory.
  static void Write(const std::string& path, const std::string& contents,
                    bool overwrite = false);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if path names an existing directory.
  static bool IsDirectory(const std::string& path);
};

class TempDir {
 public:
  explicit TempDir(const std::string& base);
  const std::string& Path() const;
  ~TempDir();

  TempDir(TempDir&&) = default;
  TempDir& operator=(TempDir&&) = default;
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
};

}  // namespace util

#endif
