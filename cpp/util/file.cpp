#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  KJ_REQUIRE(tmp->size() < max_path_len, tmp->size(), max_path_len,
             "Path too long");
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  return kj::AutoCloseFd(fd);
}

// Returns errno, or 0 on success.
int OsAtomicMove(const std::string& src, const std::string& dst,
                 bool overwrite = false, bool exist_ok = true) {
  // This may not have the desired effect if src is a symlink.
  if (overwrite) {
    if (rename(src.c_str(), dst.c_str()) == -1) return errno;
    return 0;
  }
  if (link(src.c_str(), dst.c_str()) == -1) {
    if (!exist_ok || errno != EEXIST) return errno;
    return 0;
  }
  if (remove(src.c_str()) == -1) return errno != ENOENT ? errno : 0;
  return 0;
}

util::File::ChunkReceiver OsWrite(const std::string& path, bool overwrite,
                                  bool exist_ok) {
  std::string temp_file;
  auto fd = OsTempFile(path, &temp_file);

  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  // mkostemp creates the file as 0600, results are meant to be read by the
  // caller that may not be the one running the sandbox.
  if (fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    int err = errno;
    util::File::Remove(temp_file);
    throw std::system_error(err, std::system_category(), "Write " + path);
  }
  auto done = kj::heap<bool>();
  auto pos = kj::heap<size_t>();
  auto finalize = [done = done.get(), pos = pos.get(), temp_file]() {
    if (!*done) {
      kj::UnwindDetector detector;
      detector.catchExceptionsIfUnwinding(
          [temp_file]() { util::File::Remove(temp_file); });
      if (*pos > 0) {
        KJ_LOG(WARNING, "File never finalized!", temp_file.c_str());
      }
    }
  };
  return [fd = std::move(fd), temp_file, path, overwrite, exist_ok,
          done = std::move(done), pos = std::move(pos),
          _ = kj::defer(std::move(finalize))](util::File::Chunk chunk) mutable {
    if (fd.get() == -1) return;
    if (chunk.size() == 0) {
      *done = true;
      int err = 0;
      if (fsync(fd) == -1) {
        err = errno;
      } else {
        err = OsAtomicMove(temp_file, path, overwrite, exist_ok);
      }
      fd = kj::AutoCloseFd();
      if (err != 0) {
        OsRemove(temp_file);
        throw std::system_error(err, std::system_category(), "Write " + path);
      }
      return;
    }
    *pos = 0;
    while (*pos < chunk.size()) {
      ssize_t written = write(fd, chunk.begin() + *pos,  // NOLINT
                              chunk.size() - *pos);
      if (written == -1 && errno == EINTR) continue;
      if (written == -1) {
        int err = errno;
        fd = nullptr;
        throw std::system_error(err, std::system_category(),
                                "write " + temp_file);
      }
      *pos += written;
    }
  };
}

}  // namespace

namespace util {

File::ChunkReceiver File::Write(const std::string& path, bool overwrite,
                                bool exist_ok) {
  MakeDirs(BaseDir(path));
  KJ_ASSERT(!(overwrite && !exist_ok));
  if (!overwrite && Size(path) >= 0) {
    if (exist_ok) return [](Chunk chunk) {};
    throw std::system_error(EEXIST, std::system_category(), "Write " + path);
  }
  return OsWrite(path, overwrite, exist_ok);
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir");
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove");
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(), "removetree");
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (!second.empty() && strchr(kPathSeparators, second[0]) != nullptr)
    return second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::CanCreateIn(const std::string& path) {
  std::string dir = BaseDir(path);
  if (dir.empty()) dir = path[0] == kPathSeparators[0] ? "/" : ".";
  return access(dir.c_str(), W_OK | X_OK) == 0;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
