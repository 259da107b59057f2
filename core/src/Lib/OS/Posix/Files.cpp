#if !defined(_WIN32)

  #include <algorithm>  // std::ranges::sort
  #include <cerrno>     // errno, ENOENT
  #include <cstdio>     // std::rename
  #include <dirent.h>   // opendir, readdir, closedir, DIR, dirent
  #include <fcntl.h>    // open, O_*
  #include <ftw.h>      // nftw, FTW_DEPTH, FTW_PHYS
  #include <memory>     // std::unique_ptr
  #include <sys/stat.h> // stat, lstat, chmod, mkdir
  #include <unistd.h>   // read, write, lseek, fsync, rmdir, unlink

  #include <Conduit++/Utils/Error.hpp>
  #include <Conduit++/Utils/Logging.hpp>

  #include "OS/Posix/Posix.hpp"
  #include "OS/Unix.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::files::DirEntry;
using conduit::files::EntryType;
using conduit::files::FileStat;
using conduit::files::HasMode;
using conduit::files::NativeFile;
using conduit::files::OpenMode;
using conduit::files::Permissions;
using conduit::files::SeekOrigin;

namespace unix_shared = conduit::os::unix_shared;

namespace {
  constexpr mode_t DefaultFileMode = 0666;
  constexpr mode_t DefaultDirMode  = 0777;

  auto OpenFlags(const OpenMode mode) -> int {
    const bool reading = HasMode(mode, OpenMode::Read);
    const bool writing = HasMode(mode, OpenMode::Write) || HasMode(mode, OpenMode::Append);

    int flags = O_CLOEXEC;

    if (reading && writing)
      flags |= O_RDWR;
    else if (writing)
      flags |= O_WRONLY;
    else
      flags |= O_RDONLY;

    if (HasMode(mode, OpenMode::Append))
      flags |= O_APPEND;
    if (HasMode(mode, OpenMode::Create))
      flags |= O_CREAT;
    if (HasMode(mode, OpenMode::Truncate))
      flags |= O_TRUNC;
    if (HasMode(mode, OpenMode::Exclusive))
      flags |= O_EXCL;

    return flags;
  }

  using DirCloser = decltype([](DIR* dir) { ::closedir(dir); });

  // nftw gives its callback no user pointer; the walk state lives here for the
  // duration of one removeTree call on this thread.
  thread_local u64 TreeRemoved = 0;
  thread_local int TreeErrno   = 0;

  auto RemoveVisited(const char* path, const struct stat* /*info*/, const int typeflag, FTW* /*ftw*/) -> int {
    const int result = (typeflag == FTW_DP || typeflag == FTW_D) ? ::rmdir(path) : ::unlink(path);

    if (result == -1) {
      TreeErrno = errno;
      return 1;
    }

    ++TreeRemoved;
    return 0;
  }
} // namespace

namespace conduit::os::posix {
  auto PosixFileBackend::open(const String& path, const OpenMode mode) -> Result<NativeFile> {
    const int fd = unix_shared::RetryOnEintr([&] { return ::open(path.c_str(), OpenFlags(mode), DefaultFileMode); });

    if (fd == -1)
      ERR_ERRNO("open('{}')", path);

    return static_cast<NativeFile>(fd);
  }

  auto PosixFileBackend::read(const NativeFile file, const Span<u8> buffer) -> Result<usize> {
    const ssize_t count = unix_shared::RetryOnEintr([&] { return ::read(static_cast<int>(file), buffer.data(), buffer.size()); });

    if (count == -1)
      ERR_ERRNO("read(fd {})", file);

    return static_cast<usize>(count);
  }

  auto PosixFileBackend::write(const NativeFile file, const Span<const u8> data) -> Result<usize> {
    const ssize_t count = unix_shared::RetryOnEintr([&] { return ::write(static_cast<int>(file), data.data(), data.size()); });

    if (count == -1)
      ERR_ERRNO("write(fd {})", file);

    return static_cast<usize>(count);
  }

  auto PosixFileBackend::seek(const NativeFile file, const i64 offset, const SeekOrigin origin) -> Result<u64> {
    int whence = SEEK_SET;

    switch (origin) {
      case SeekOrigin::Begin:   whence = SEEK_SET; break;
      case SeekOrigin::Current: whence = SEEK_CUR; break;
      case SeekOrigin::End:     whence = SEEK_END; break;
    }

    const off_t position = ::lseek(static_cast<int>(file), static_cast<off_t>(offset), whence);

    if (position == -1)
      ERR_ERRNO("lseek(fd {}, {})", file, offset);

    return static_cast<u64>(position);
  }

  auto PosixFileBackend::sync(const NativeFile file) -> Result<> {
    if (unix_shared::RetryOnEintr([&] { return ::fsync(static_cast<int>(file)); }) == -1)
      ERR_ERRNO("fsync(fd {})", file);

    return {};
  }

  auto PosixFileBackend::close(const NativeFile file) -> Result<> {
    return unix_shared::CloseFd(static_cast<int>(file), std::format("fd {}", file));
  }

  auto PosixFileBackend::stat(const String& path, const bool followLinks) -> Result<FileStat> {
    struct stat info {};

    if ((followLinks ? ::stat(path.c_str(), &info) : ::lstat(path.c_str(), &info)) == -1)
      ERR_ERRNO("stat('{}')", path);

    return unix_shared::ToFileStat(info);
  }

  auto PosixFileBackend::list(const String& path) -> Result<Vec<DirEntry>> {
    const std::unique_ptr<DIR, DirCloser> dir(::opendir(path.c_str()));

    if (!dir)
      ERR_ERRNO("opendir('{}')", path);

    Vec<DirEntry> entries;

    while (true) {
      errno = 0;

      const dirent* entry = ::readdir(dir.get());

      if (entry == nullptr) {
        if (errno != 0)
          ERR_ERRNO("readdir('{}')", path);
        break;
      }

      const StringView name(entry->d_name);

      if (name == "." || name == "..")
        continue;

      EntryType type = EntryType::Other;

  #ifdef DT_DIR
      switch (entry->d_type) {
        case DT_REG: type = EntryType::File; break;
        case DT_DIR: type = EntryType::Directory; break;
        case DT_LNK: type = EntryType::Symlink; break;
        case DT_UNKNOWN: {
          // Some filesystems (XFS without ftype, some network mounts) leave d_type empty.
          const String child = path.ends_with('/') ? path + String(name) : std::format("{}/{}", path, name);
          if (Result<FileStat> info = stat(child, false))
            type = info->type;
          break;
        }
        default: break;
      }
  #else
      const String child = path.ends_with('/') ? path + String(name) : std::format("{}/{}", path, name);
      if (Result<FileStat> info = stat(child, false))
        type = info->type;
  #endif

      entries.push_back({ .name = String(name), .type = type });
    }

    std::ranges::sort(entries, {}, &DirEntry::name);
    return entries;
  }

  auto PosixFileBackend::remove(const String& path) -> Result<> {
    struct stat info {};

    if (::lstat(path.c_str(), &info) == -1)
      ERR_ERRNO("lstat('{}')", path);

    if (S_ISDIR(info.st_mode) ? ::rmdir(path.c_str()) == -1 : ::unlink(path.c_str()) == -1)
      ERR_ERRNO("remove('{}')", path);

    return {};
  }

  auto PosixFileBackend::createDirectory(const String& path) -> Result<> {
    if (::mkdir(path.c_str(), DefaultDirMode) == -1)
      ERR_ERRNO("mkdir('{}')", path);

    return {};
  }

  auto PosixFileBackend::rename(const String& from, const String& to) -> Result<> {
    if (std::rename(from.c_str(), to.c_str()) == -1)
      ERR_ERRNO("rename('{}', '{}')", from, to);

    return {};
  }

  auto PosixFileBackend::setPermissions(const String& path, const Permissions permissions) -> Result<> {
    struct stat info {};

    if (::stat(path.c_str(), &info) == -1)
      ERR_ERRNO("stat('{}')", path);

    if (::chmod(path.c_str(), unix_shared::ApplyPermissions(info.st_mode, permissions)) == -1)
      ERR_ERRNO("chmod('{}')", path);

    return {};
  }

  auto PosixFileBackend::removeTree(const String& path) -> Result<u64> {
    struct stat info {};

    if (::lstat(path.c_str(), &info) == -1)
      ERR_ERRNO("lstat('{}')", path);

    TreeRemoved = 0;
    TreeErrno   = 0;

    constexpr int MaxOpenDescriptors = 64;

    const int walked = ::nftw(path.c_str(), RemoveVisited, MaxOpenDescriptors, FTW_DEPTH | FTW_PHYS);

    if (walked == -1)
      ERR_ERRNO("nftw('{}')", path);

    if (walked != 0)
      return Err(utils::error::FromErrno(TreeErrno, std::format("remove tree '{}' after {} entries", path, TreeRemoved)));

    return TreeRemoved;
  }
} // namespace conduit::os::posix

#endif // !defined(_WIN32)
