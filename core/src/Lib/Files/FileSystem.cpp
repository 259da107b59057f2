#include <algorithm> // std::ranges::sort
#include <utility>   // std::exchange

#include <Conduit++/Core/Dispatch.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Files/Path.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

#include "Files/FileBackend.hpp"

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::Dispatch;
using conduit::core::capability::BackendId;

namespace ops = conduit::core::ops;

namespace {
  constexpr usize ChunkSize = 64 * 1024;
} // namespace

namespace conduit::files {
  // ─────────────────────────────────────────────────────────────────────────────
  // File
  // ─────────────────────────────────────────────────────────────────────────────

  File::File(const core::Context& ctx, FileBackend& backend, const NativeFile handle, String path)
    : m_ctx(&ctx), m_backend(&backend), m_handle(handle), m_path(std::move(path)) {}

  File::File(File&& other) noexcept
    : m_ctx(other.m_ctx), m_backend(other.m_backend), m_handle(std::exchange(other.m_handle, InvalidFile)), m_path(std::move(other.m_path)) {}

  auto File::operator=(File&& other) noexcept -> File& {
    if (this != &other) {
      if (isOpen())
        if (Result<> closed = m_backend->close(m_handle); !closed)
          warn_at(closed.error());

      m_ctx     = other.m_ctx;
      m_backend = other.m_backend;
      m_handle  = std::exchange(other.m_handle, InvalidFile);
      m_path    = std::move(other.m_path);
    }

    return *this;
  }

  File::~File() {
    if (!isOpen())
      return;

    if (Result<> closed = m_backend->close(m_handle); !closed)
      warn_at(closed.error());
  }

  auto File::requireOpen() const -> Result<> {
    if (!isOpen())
      ERR_FMT(InvalidArgument, "File '{}' is not open", m_path);

    return {};
  }

  auto File::read(const Span<u8> buffer) -> Result<usize> {
    TRY_VOID(requireOpen());
    return m_backend->read(m_handle, buffer);
  }

  auto File::readAll() -> Result<Bytes> {
    TRY_VOID(requireOpen());

    Bytes data;

    while (true) {
      const usize offset = data.size();
      data.resize(offset + ChunkSize);

      const usize count = TRY(m_backend->read(m_handle, Span<u8>(data).subspan(offset)));
      data.resize(offset + count);

      if (count == 0)
        break;
    }

    return data;
  }

  auto File::write(const Span<const u8> data) -> Result<usize> {
    TRY_VOID(requireOpen());
    return m_backend->write(m_handle, data);
  }

  auto File::writeAll(Span<const u8> data) -> Result<> {
    TRY_VOID(requireOpen());

    while (!data.empty()) {
      const usize written = TRY(m_backend->write(m_handle, data));

      if (written == 0)
        ERR_FMT(PlatformError, "Write to '{}' made no progress", m_path);

      data = data.subspan(written);
    }

    return {};
  }

  auto File::writeAll(const StringView text) -> Result<> {
    return writeAll(Span<const u8>(reinterpret_cast<const u8*>(text.data()), text.size()));
  }

  auto File::seek(const i64 offset, const SeekOrigin origin) -> Result<u64> {
    TRY_VOID(requireOpen());
    return m_backend->seek(m_handle, offset, origin);
  }

  auto File::sync() -> Result<> {
    TRY_VOID(requireOpen());

    // The handle stays with the backend that opened it, whatever the registry names.
    return Dispatch<void>(*m_ctx, ops::FileSync, { .native = [this](BackendId) -> Result<> { return m_backend->sync(m_handle); } });
  }

  auto File::close() -> Result<> {
    TRY_VOID(requireOpen());

    trace_log("Closing {}", m_path);
    return m_backend->close(std::exchange(m_handle, InvalidFile));
  }

  // ─────────────────────────────────────────────────────────────────────────────
  // FileSystem
  // ─────────────────────────────────────────────────────────────────────────────

  FileSystem::FileSystem(const core::Context& ctx) : m_ctx(ctx) {}

  auto FileSystem::native(const StringView logical) const -> Result<String> {
    return path::ToNative(logical, m_ctx.profile().family);
  }

  auto FileSystem::normalize(const StringView path) const -> Result<String> {
    return path::Normalize(path);
  }

  auto FileSystem::open(const StringView path, const OpenMode mode) -> Result<File> {
    if (!HasMode(mode, OpenMode::Read) && !HasMode(mode, OpenMode::Write) && !HasMode(mode, OpenMode::Append))
      ERR_FMT(InvalidArgument, "Opening '{}' needs Read, Write or Append", path);

    if (HasMode(mode, OpenMode::Exclusive) && !HasMode(mode, OpenMode::Create))
      ERR_FMT(InvalidArgument, "Exclusive open of '{}' requires Create", path);

    const String nativePath = TRY(native(path));

    return Dispatch<File>(m_ctx, ops::FileOpen, { .native = [&](const BackendId id) -> Result<File> {
      FileBackend*     backend = TRY(GetFileBackend(id));
      const NativeFile handle  = TRY(backend->open(nativePath, mode));

      trace_log_fields(Fields(field(mode, static_cast<u8>(mode))), "Opened {}", path);
      return File(m_ctx, *backend, handle, String(path));
    } });
  }

  auto FileSystem::create(const StringView path) -> Result<File> {
    return open(path, OpenMode::Write | OpenMode::Create | OpenMode::Truncate);
  }

  auto FileSystem::remove(const StringView path) -> Result<> {
    const String nativePath = TRY(native(path));

    return Dispatch<void>(m_ctx, ops::FileRemove, { .native = [&](const BackendId id) -> Result<> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->remove(nativePath);
    } });
  }

  auto FileSystem::removeAll(const StringView path) -> Result<u64> {
    const String nativePath = TRY(native(path));

    Result<u64> removed = Dispatch<u64>(
      m_ctx,
      ops::FileRemoveAll,
      {
        .native = [&](const BackendId id) -> Result<u64> {
          FileBackend* backend = TRY(GetFileBackend(id));
          return backend->removeTree(nativePath);
        },
        .emulate = [&] -> Result<u64> { return emulateRemoveAll(path); },
      }
    );

    if (removed)
      debug_log("Removed {} entries under {}", *removed, path);

    return removed;
  }

  auto FileSystem::emulateRemoveAll(const StringView path) -> Result<u64> {
    const String nativePath = TRY(native(path));

    const FileStat info = TRY(Dispatch<FileStat>(m_ctx, ops::FileStat, { .native = [&](const BackendId id) -> Result<FileStat> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->stat(nativePath, false);
    } }));

    u64 removed = 0;

    if (info.type == EntryType::Directory)
      for (const DirEntry& entry : TRY(list(path)))
        removed += TRY(emulateRemoveAll(path::Join(path, entry.name)));

    TRY_VOID(remove(path));
    return removed + 1;
  }

  auto FileSystem::createDirectory(const StringView path) -> Result<> {
    const String nativePath = TRY(native(path));

    return Dispatch<void>(m_ctx, ops::FileCreateDir, { .native = [&](const BackendId id) -> Result<> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->createDirectory(nativePath);
    } });
  }

  auto FileSystem::createDirectories(const StringView path) -> Result<> {
    const String normalized = TRY(path::Normalize(path));

    String     current;
    StringView rest = normalized;

    if (path::IsAbsolute(rest)) {
      const usize rootEnd = rest.find('/') + 1;
      current             = String(rest.substr(0, rootEnd));
      rest.remove_prefix(rootEnd);
    }

    while (!rest.empty()) {
      const usize      slash   = rest.find('/');
      const StringView segment = rest.substr(0, slash);
      rest                     = slash == StringView::npos ? StringView {} : rest.substr(slash + 1);

      current = path::Join(current, segment);

      if (Result<FileStat> info = stat(current)) {
        if (info->type != EntryType::Directory)
          ERR_FMT(InvalidArgument, "'{}' exists and is not a directory", current);

        continue;
      } else if (info.error().kind != NotFound)
        return Err(info.error());

      if (Result<> made = createDirectory(current); !made) {
        // Lost a race with another creator; fine if it made a directory.
        if (Result<FileStat> again = stat(current); again && again->type == EntryType::Directory)
          continue;

        return made;
      }
    }

    return {};
  }

  auto FileSystem::list(const StringView path) -> Result<Vec<DirEntry>> {
    const String nativePath = TRY(native(path));

    Vec<DirEntry> entries = TRY(Dispatch<Vec<DirEntry>>(m_ctx, ops::FileList, { .native = [&](const BackendId id) -> Result<Vec<DirEntry>> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->list(nativePath);
    } }));

    std::ranges::sort(entries, {}, &DirEntry::name);
    return entries;
  }

  auto FileSystem::stat(const StringView path) -> Result<FileStat> {
    const String nativePath = TRY(native(path));

    return Dispatch<FileStat>(m_ctx, ops::FileStat, { .native = [&](const BackendId id) -> Result<FileStat> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->stat(nativePath, true);
    } });
  }

  auto FileSystem::exists(const StringView path) -> Result<bool> {
    Result<FileStat> info = stat(path);

    if (info)
      return true;

    if (info.error().kind == NotFound)
      return false;

    return Err(info.error());
  }

  auto FileSystem::rename(const StringView from, const StringView to) -> Result<> {
    const String nativeFrom = TRY(native(from));
    const String nativeTo   = TRY(native(to));

    return Dispatch<void>(m_ctx, ops::FileRename, { .native = [&](const BackendId id) -> Result<> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->rename(nativeFrom, nativeTo);
    } });
  }

  auto FileSystem::copy(const StringView from, const StringView to, const bool overwrite) -> Result<u64> {
    const String nativeFrom = TRY(native(from));
    const String nativeTo   = TRY(native(to));

    if (overwrite)
      TRY_VOID(rejectSelfCopy(from, to));

    return Dispatch<u64>(
      m_ctx,
      ops::FileCopy,
      {
        .native = [&](const BackendId id) -> Result<u64> {
          FileBackend* backend = TRY(GetFileBackend(id));
          return backend->copy(nativeFrom, nativeTo, overwrite);
        },
        .emulate = [&] -> Result<u64> { return emulateCopy(from, to, overwrite); },
      }
    );
  }

  // Opening the target with Truncate would empty the source before it is read.
  auto FileSystem::rejectSelfCopy(const StringView from, const StringView to) -> Result<> {
    Result<FileStat> target = stat(to);

    if (!target) {
      if (target.error().kind == NotFound)
        return {};

      return Err(target.error());
    }

    const FileStat source = TRY(stat(from));

    if (source.identity && source.identity == target->identity)
      ERR_FMT(InvalidArgument, "'{}' and '{}' are the same file", from, to);

    return {};
  }

  auto FileSystem::emulateCopy(const StringView from, const StringView to, const bool overwrite) -> Result<u64> {
    const FileStat source = TRY(stat(from));

    if (source.type == EntryType::Directory)
      ERR_FMT(InvalidArgument, "Cannot copy directory '{}'", from);

    OpenMode targetMode = OpenMode::Write | OpenMode::Create | OpenMode::Truncate;

    if (!overwrite)
      targetMode |= OpenMode::Exclusive;

    File input  = TRY(open(from, OpenMode::Read));
    File output = TRY(open(to, targetMode));

    Bytes buffer(ChunkSize);
    u64   copied = 0;

    while (true) {
      const usize count = TRY(input.read(buffer));

      if (count == 0)
        break;

      TRY_VOID(output.writeAll(Span<const u8>(buffer.data(), count)));
      copied += count;
    }

    TRY_VOID(output.close());
    TRY_VOID(input.close());
    TRY_VOID(setPermissions(to, source.permissions));

    return copied;
  }

  auto FileSystem::find(const StringView root, const StringView pattern) -> Result<Vec<String>> {
    if (pattern.empty())
      ERR(InvalidArgument, "Search pattern is empty");

    const bool caseSensitive = m_ctx.profile().has(core::platform::Capability::CaseSensitiveFs);

    return Dispatch<Vec<String>>(
      m_ctx,
      ops::FileFind,
      {
        .native = [&](BackendId) -> Result<Vec<String>> {
          ERR(Unsupported, "No native recursive search is registered");
        },
        .emulate = [&] -> Result<Vec<String>> {
          Vec<String> matches;
          Vec<String> pending { String(root) };

          while (!pending.empty()) {
            const String directory = std::move(pending.back());
            pending.pop_back();

            for (const DirEntry& entry : TRY(list(directory))) {
              String full = path::Join(directory, entry.name);

              if (path::MatchGlob(pattern, entry.name, caseSensitive))
                matches.push_back(full);

              if (entry.type == EntryType::Directory)
                pending.push_back(std::move(full));
            }
          }

          std::ranges::sort(matches);
          return matches;
        },
      }
    );
  }

  auto FileSystem::setPermissions(const StringView path, const Permissions permissions) -> Result<> {
    const String nativePath = TRY(native(path));

    return Dispatch<void>(m_ctx, ops::FileSetPermissions, { .native = [&](const BackendId id) -> Result<> {
      FileBackend* backend = TRY(GetFileBackend(id));
      return backend->setPermissions(nativePath, permissions);
    } });
  }

  auto FileSystem::readFile(const StringView path) -> Result<Bytes> {
    File  file = TRY(open(path, OpenMode::Read));
    Bytes data = TRY(file.readAll());

    TRY_VOID(file.close());
    return data;
  }

  auto FileSystem::readText(const StringView path) -> Result<String> {
    const Bytes data = TRY(readFile(path));
    return String(data.begin(), data.end());
  }

  auto FileSystem::writeFile(const StringView path, const Span<const u8> data) -> Result<> {
    File file = TRY(create(path));

    TRY_VOID(file.writeAll(data));
    return file.close();
  }

  auto FileSystem::writeText(const StringView path, const StringView text) -> Result<> {
    return writeFile(path, Span<const u8>(reinterpret_cast<const u8*>(text.data()), text.size()));
  }
} // namespace conduit::files
