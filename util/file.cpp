#include "util/file.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <memory>

#include "glog/logging.h"

namespace {

static const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* sb, int typeflags,
                 struct FTW* ftwbuf) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  std::unique_ptr<char[]> data{strdup(tmp.c_str())};
  if (mkdtemp(data.get()) == nullptr) {
    return "";
  }
  return data.get();
}

int OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  std::unique_ptr<char[]> data{strdup(tmp->c_str())};
  int fd = mkostemp(data.get(), O_CLOEXEC);
  *tmp = data.get();
  return fd;
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite) {
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) return errno;
  return remove(src.c_str()) != -1 ? 0 : errno;
}

// Returns errno, or 0 on success.
int OsRead(const std::string& path, std::string* content) {
  int fd = open(path.c_str(), O_CLOEXEC | O_RDONLY);
  if (fd == -1) return errno;
  char buf[util::kChunkSize] = {};
  ssize_t amount;
  while ((amount = read(fd, buf, util::kChunkSize))) {
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) break;
    content->append(buf, amount);
  }
  if (amount == -1) {
    int error = errno;
    close(fd);
    return error;
  }
  return close(fd) == -1 ? errno : 0;
}

// Returns errno, or 0 on success.
int OsWrite(const std::string& path, const std::string& content,
            bool overwrite) {
  std::string temp_file;
  int fd = OsTempFile(path, &temp_file);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos, content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      remove(temp_file.c_str());
      return error;
    }
    pos += written;
  }
  if (close(fd) == -1) return errno;
  int error = OsAtomicMove(temp_file, path, overwrite);
  if (error) remove(temp_file.c_str());
  return error;
}

void OsListTree(const std::string& root, const std::string& relative,
                std::vector<util::File::Entry>* entries) {
  std::string dir_path =
      relative.empty() ? root : util::File::JoinPath(root, relative);
  DIR* dir = opendir(dir_path.c_str());
  if (dir == nullptr) {
    throw std::system_error(errno, std::system_category(),
                            "opendir " + dir_path);
  }
  std::vector<std::string> children;
  while (struct dirent* ent = readdir(dir)) {
    if (!strcmp(ent->d_name, ".") || !strcmp(ent->d_name, "..")) continue;
    children.emplace_back(ent->d_name);
  }
  closedir(dir);
  for (const std::string& child : children) {
    std::string rel =
        relative.empty() ? child : util::File::JoinPath(relative, child);
    struct stat st {};
    if (lstat(util::File::JoinPath(root, rel).c_str(), &st) == -1) continue;
    if (S_ISDIR(st.st_mode)) {
      entries->push_back({rel, true});
      OsListTree(root, rel, entries);
    } else if (S_ISREG(st.st_mode)) {
      entries->push_back({rel, false});
    }
  }
}

}  // namespace

namespace util {

std::string File::Read(const std::string& path) {
  std::string content;
  int err = OsRead(path, &content);
  if (err == ENOENT) throw file_not_found("Read " + path);
  if (err) throw std::system_error(err, std::system_category(), "Read " + path);
  return content;
}

void File::Write(const std::string& path, const std::string& content,
                 bool overwrite) {
  MakeDirs(BaseDir(path));
  if (!overwrite && Exists(path)) throw file_exists("Write " + path);
  int err = OsWrite(path, content, overwrite);
  if (err == EEXIST) throw file_exists("Write " + path);
  if (err) throw std::system_error(err, std::system_category(), path);
}

void File::MakeDirs(const std::string& path) {
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Copy(const std::string& from, const std::string& to,
                bool overwrite) {
  Write(to, Read(from), overwrite);
}

void File::CopyTree(const std::string& from, const std::string& to) {
  MakeDirs(to);
  for (const Entry& entry : ListTree(from)) {
    std::string dest = JoinPath(to, entry.path);
    if (entry.is_directory) {
      MakeDirs(dest);
    } else {
      Copy(JoinPath(from, entry.path), dest, /*overwrite=*/true);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path))
    throw std::system_error(errno, std::system_category(), "remove " + path);
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path))
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
}

std::vector<File::Entry> File::ListTree(const std::string& root) {
  std::vector<Entry> entries;
  OsListTree(root, "", &entries);
  std::sort(entries.begin(), entries.end(),
            [](const Entry& a, const Entry& b) { return a.path < b.path; });
  return entries;
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0])) return second;
  if (first.empty()) return second;
  if (first.back() == kPathSeparators[0]) return first + second;
  return first + kPathSeparators[0] + second;
}

std::string File::BaseDir(const std::string& path) {
  size_t pos = path.find_last_of(kPathSeparators);
  if (pos == std::string::npos) return ".";
  if (pos == 0) return "/";
  return path.substr(0, pos);
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) == -1) return -1;
  return st.st_size;
}

bool File::Exists(const std::string& path) {
  struct stat st {};
  return lstat(path.c_str(), &st) == 0;
}

bool File::IsDirectory(const std::string& path) {
  struct stat st {};
  return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_ == "")
    throw std::system_error(errno, std::system_category(), "mkdtemp");
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {
  if (moved_ || keep_) return;
  try {
    File::RemoveTree(path_);
  } catch (const std::system_error& exc) {
    LOG(WARNING) << "Could not remove " << path_ << ": " << exc.what();
  }
}

}  // namespace util
