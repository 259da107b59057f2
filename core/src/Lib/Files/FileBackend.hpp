#pragma once

#include <Conduit++/Core/Capability.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Types.hpp>

namespace conduit::files {
  namespace types = ::conduit::utils::types;

  /**
   * @class FileBackend
   * @brief Native file primitives. Every path argument is already in native form.
   */
  class FileBackend {
   public:
    FileBackend()                                      = default;
    FileBackend(const FileBackend&)                    = delete;
    FileBackend(FileBackend&&)                         = delete;
    auto operator=(const FileBackend&) -> FileBackend& = delete;
    auto operator=(FileBackend&&) -> FileBackend&      = delete;
    virtual ~FileBackend()                             = default;

    virtual auto open(const types::String& path, OpenMode mode) -> types::Result<NativeFile>                       = 0;
    virtual auto read(NativeFile file, types::Span<types::u8> buffer) -> types::Result<types::usize>               = 0;
    virtual auto write(NativeFile file, types::Span<const types::u8> data) -> types::Result<types::usize>          = 0;
    virtual auto seek(NativeFile file, types::i64 offset, SeekOrigin origin) -> types::Result<types::u64>          = 0;
    virtual auto sync(NativeFile file) -> types::Result<>                                                          = 0;
    virtual auto close(NativeFile file) -> types::Result<>                                                         = 0;

    /**
     * @param followLinks  When false, a symlink is described as itself rather than its target.
     */
    virtual auto stat(const types::String& path, bool followLinks) -> types::Result<FileStat>                      = 0;
    virtual auto list(const types::String& path) -> types::Result<types::Vec<DirEntry>>                            = 0;

    /**
     * @brief Removes a file, a symlink or an empty directory.
     */
    virtual auto remove(const types::String& path) -> types::Result<>                                              = 0;
    virtual auto createDirectory(const types::String& path) -> types::Result<>                                     = 0;
    virtual auto rename(const types::String& from, const types::String& to) -> types::Result<>                     = 0;
    virtual auto setPermissions(const types::String& path, Permissions permissions) -> types::Result<>             = 0;

    /**
     * @brief Removes a whole tree in one native call. Returns the number of entries removed.
     */
    virtual auto removeTree(const types::String& path) -> types::Result<types::u64> {
      ERR_FMT(utils::error::ErrorKind::Unsupported, "No native tree removal for '{}'", path);
    }

    /**
     * @brief Kernel- or OS-assisted file copy. Returns the number of bytes copied.
     */
    virtual auto copy(const types::String& from, const types::String& to, bool /*overwrite*/) -> types::Result<types::u64> {
      ERR_FMT(utils::error::ErrorKind::Unsupported, "No native copy for '{}' -> '{}'", from, to);
    }
  };

  /**
   * @brief Returns the backend compiled in for `id`.
   * @return Unsupported if this build does not contain that backend.
   */
  auto GetFileBackend(core::capability::BackendId id) -> types::Result<FileBackend*>;
} // namespace conduit::files
