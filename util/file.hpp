#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace util {

class file_exists : public std::system_error {
 public:
  explicit file_exists(const std::string& msg)
      : std::system_error(EEXIST, std::system_category(), msg) {}
};

class file_not_found : public std::system_error {
 public:
  explicit file_not_found(const std::string& msg)
      : std::system_error(ENOENT, std::system_category(), msg) {}
};

static const constexpr uint32_t kChunkSize = 32 * 1024;

class File {
 public:
  // An entry of a directory tree, relative to the root of the listing.
  struct Entry {
    std::string path;
    bool is_directory = false;
  };

  // Reads the whole file specified by path.
  static std::string Read(const std::string& path);

  // Writes content to path, atomically replacing it. Parent folders are
  // created when missing.
  static void Write(const std::string& path, const std::string& content,
                    bool overwrite = true);

  // Creates all the folder that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Makes a full copy of the given file.
  static void Copy(const std::string& from, const std::string& to,
                   bool overwrite = false);

  // Copies every regular file and folder under from into to. Symbolic links
  // are not followed nor copied.
  static void CopyTree(const std::string& from, const std::string& to);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Lists every regular file and folder under root, sorted by path. Symbolic
  // links are not followed and are not reported.
  static std::vector<Entry> ListTree(const std::string& root);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if something exists at path, without following symlinks.
  static bool Exists(const std::string& path);

  static bool IsDirectory(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created,
  // it is created if missing.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
