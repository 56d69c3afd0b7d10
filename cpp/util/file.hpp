#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <memory>
#include <string>

#include <kj/common.h>
#include <kj/function.h>

namespace util {

class File {
 public:
  // A non-owning pointer to a sequence of bytes, usually representing a part of
  // a file.
  using Chunk = kj::ArrayPtr<const kj::byte>;

  // A ChunkReceiver is a function that should be called one or more times with
  // a valid Chunk. An empty Chunk represents EOF.
  using ChunkReceiver = kj::Function<void(Chunk)>;

  // Returns a receiver that writes to a temporary file next to path. When the
  // empty chunk is received the temporary file is synced and atomically
  // moved to path, so readers never observe a partial file. If the receiver
  // is destroyed before that, the temporary file is removed.
  static ChunkReceiver Write(const std::string& path, bool overwrite = false,
                             bool exist_ok = true);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  // Returns true if new files can be created inside the directory of path
  // by the current user. Nothing is written.
  static bool CanCreateIn(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
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
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
