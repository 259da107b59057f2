#pragma once

#include "../Core/Capability.hpp"
#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::files {
  namespace types = ::conduit::utils::types;

  class FileBackend;

  /// fd on POSIX, HANDLE on Windows.
  using NativeFile = types::isize;

  inline constexpr NativeFile InvalidFile = -1;

  enum class OpenMode : types::u8 {
    Read      = 1 << 0,
    Write     = 1 << 1,
    Append    = 1 << 2, ///< Every write goes to the end of the file.
    Create    = 1 << 3, ///< Create the file if it does not exist.
    Truncate  = 1 << 4, ///< Discard existing contents.
    Exclusive = 1 << 5, ///< Fail with InvalidArgument if the file already exists (requires Create).
  };

  constexpr auto operator|(OpenMode lhs, OpenMode rhs) -> OpenMode {
    return static_cast<OpenMode>(static_cast<types::u8>(lhs) | static_cast<types::u8>(rhs));
  }

  constexpr auto operator|=(OpenMode& lhs, OpenMode rhs) -> OpenMode& {
    return lhs = lhs | rhs;
  }

  constexpr auto HasMode(const OpenMode flags, const OpenMode mode) -> bool {
    return (static_cast<types::u8>(flags) & static_cast<types::u8>(mode)) == static_cast<types::u8>(mode);
  }

  enum class SeekOrigin : types::u8 {
    Begin,
    Current,
    End,
  };

  enum class EntryType : types::u8 {
    File,
    Directory,
    Symlink,
    Other,
  };

  /**
   * @struct Permissions
   * @brief Access rights of the owning user, reduced to what every platform can express.
   */
  struct Permissions {
    bool readable   = true;
    bool writable   = true;
    bool executable = false;

    auto operator==(const Permissions&) const -> bool = default;
  };

  /**
   * @brief Names the underlying file independently of the path used to reach it.
   */
  struct FileIdentity {
    types::u64 device = 0;
    types::u64 file   = 0;

    auto operator==(const FileIdentity&) const -> bool = default;
  };

  struct FileStat {
    types::u64                  size = 0;
    types::Timestamp            modified;
    Permissions                 permissions;
    EntryType                   type = EntryType::File;
    types::Option<FileIdentity> identity; ///< None where the native query does not report one.
  };

  struct DirEntry {
    types::String name; ///< Entry name only, no directory part.
    EntryType     type = EntryType::File;

    auto operator==(const DirEntry&) const -> bool = default;
  };

  /**
   * @class File
   * @brief Exclusively owned open file.
   *
   * Bound to the backend that opened it for its whole lifetime. Not safe for
   * concurrent use from several threads. The destructor closes the file if
   * close() was not called.
   */
  class File {
   public:
    File() = default;
    File(const File&) = delete;
    File(File&& other) noexcept;
    auto operator=(const File&) -> File& = delete;
    auto operator=(File&& other) noexcept -> File&;
    ~File();

    /**
     * @brief Reads up to buffer.size() bytes. Returns 0 at end of file.
     */
    auto read(types::Span<types::u8> buffer) -> types::Result<types::usize>;

    /**
     * @brief Reads from the current position to end of file.
     */
    auto readAll() -> types::Result<types::Bytes>;

    /**
     * @brief Writes up to data.size() bytes and returns how many were written.
     */
    auto write(types::Span<const types::u8> data) -> types::Result<types::usize>;

    /**
     * @brief Writes all of `data`, retrying short writes.
     */
    auto writeAll(types::Span<const types::u8> data) -> types::Result<>;

    auto writeAll(types::StringView text) -> types::Result<>;

    /**
     * @brief Moves the file position. Returns the new absolute offset.
     */
    auto seek(types::i64 offset, SeekOrigin origin = SeekOrigin::Begin) -> types::Result<types::u64>;

    /**
     * @brief Flushes written data to stable storage (fsync / FlushFileBuffers).
     * @note Where the platform cannot do this, succeeds without flushing.
     */
    auto sync() -> types::Result<>;

    /**
     * @brief Releases the native handle.
     * @return InvalidArgument if the file is not open.
     */
    auto close() -> types::Result<>;

    [[nodiscard]] auto isOpen() const -> bool {
      return m_handle != InvalidFile;
    }

    [[nodiscard]] auto path() const -> const types::String& {
      return m_path;
    }

   private:
    friend class FileSystem;

    File(const core::Context& ctx, FileBackend& backend, NativeFile handle, types::String path);

    auto requireOpen() const -> types::Result<>;

    const core::Context* m_ctx     = nullptr;
    FileBackend*         m_backend = nullptr;
    NativeFile           m_handle  = InvalidFile;
    types::String        m_path;
  };

  /**
   * @class FileSystem
   * @brief File operations adapter.
   *
   * All paths are logical (see Path.hpp). Calls are synchronous. The layer adds
   * no locking of its own: when the OS refuses concurrent access (sharing
   * violations on Windows, ETXTBSY/EBUSY on POSIX) the call fails with
   * ResourceBusy; otherwise concurrent writers behave as the filesystem does.
   */
  class FileSystem {
   public:
    explicit FileSystem(const core::Context& ctx);

    auto open(types::StringView path, OpenMode mode) -> types::Result<File>;

    /**
     * @brief Opens for writing, creating or truncating the file.
     */
    auto create(types::StringView path) -> types::Result<File>;

    /**
     * @brief Removes a file or an empty directory.
     */
    auto remove(types::StringView path) -> types::Result<>;

    /**
     * @brief Removes a file or a directory tree. Returns the number of entries removed.
     * @return NotFound if `path` does not exist.
     */
    auto removeAll(types::StringView path) -> types::Result<types::u64>;

    auto createDirectory(types::StringView path) -> types::Result<>;

    /**
     * @brief Creates `path` and any missing parents. Existing directories are not an error.
     */
    auto createDirectories(types::StringView path) -> types::Result<>;

    /**
     * @brief Lists a directory, sorted by name, without "." and "..".
     */
    auto list(types::StringView path) -> types::Result<types::Vec<DirEntry>>;

    auto stat(types::StringView path) -> types::Result<FileStat>;

    /**
     * @brief True if `path` exists; NotFound is not an error here, other failures are.
     */
    auto exists(types::StringView path) -> types::Result<bool>;

    /**
     * @brief Renames or moves `from` to `to`, replacing an existing file at `to`.
     */
    auto rename(types::StringView from, types::StringView to) -> types::Result<>;

    /**
     * @brief Copies a regular file. Returns the number of bytes copied.
     * @return InvalidArgument if `to` exists and `overwrite` is false.
     */
    auto copy(types::StringView from, types::StringView to, bool overwrite = false) -> types::Result<types::u64>;

    /**
     * @brief Recursively finds entries under `root` whose name matches `pattern` (`*`, `?`).
     * @return Logical paths, sorted.
     */
    auto find(types::StringView root, types::StringView pattern) -> types::Result<types::Vec<types::String>>;

    auto setPermissions(types::StringView path, Permissions permissions) -> types::Result<>;

    auto readFile(types::StringView path) -> types::Result<types::Bytes>;

    auto readText(types::StringView path) -> types::Result<types::String>;

    /**
     * @brief Creates or truncates `path` and writes `data` to it.
     */
    auto writeFile(types::StringView path, types::Span<const types::u8> data) -> types::Result<>;

    auto writeText(types::StringView path, types::StringView text) -> types::Result<>;

    /**
     * @brief Lexical normalization (see path::Normalize).
     */
    [[nodiscard]] auto normalize(types::StringView path) const -> types::Result<types::String>;

   private:
    auto native(types::StringView logical) const -> types::Result<types::String>;

    auto emulateRemoveAll(types::StringView path) -> types::Result<types::u64>;
    auto emulateCopy(types::StringView from, types::StringView to, bool overwrite) -> types::Result<types::u64>;
    auto rejectSelfCopy(types::StringView from, types::StringView to) -> types::Result<>;

    const core::Context& m_ctx;
  };
} // namespace conduit::files
