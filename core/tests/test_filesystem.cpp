#include <boost/ut.hpp>

#include <chrono>

#include <Conduit++/Core/Context.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Files/FileSystem.hpp>
#include <Conduit++/Files/Path.hpp>

using namespace boost::ut;
using namespace conduit::files;
using namespace conduit::utils::types;

using conduit::core::Context;
using conduit::core::capability::CapabilityDescriptor;
using conduit::core::capability::CapabilityRegistry;
using conduit::core::platform::Detect;
using conduit::core::platform::GetKnownDirectory;
using conduit::core::platform::KnownDirectory;
using conduit::utils::error::ErrorKind;

namespace ops = conduit::core::ops;

namespace {
  auto ScratchRoot() -> String {
    const String temp  = GetKnownDirectory(Detect(), KnownDirectory::Temp).value_or("/tmp");
    const auto   stamp = std::chrono::steady_clock::now().time_since_epoch().count();

    return std::format("{}/conduit-fs-{}", temp, stamp);
  }

  /// Same host, but with the native entries of `stripped` removed so their fallbacks run.
  auto WithoutNative(std::initializer_list<StringView> stripped) -> UniquePointer<Context> {
    Vec<CapabilityDescriptor> table = CapabilityRegistry::defaultTable();

    for (CapabilityDescriptor& descriptor : table)
      for (const StringView operation : stripped)
        if (descriptor.operation == operation)
          descriptor.entries.clear();

    return std::make_unique<Context>(Detect(), CapabilityRegistry(std::move(table)));
  }

  auto Seed(FileSystem& fs, const String& root) -> void {
    expect(fs.createDirectories(root + "/tree/a/b").has_value());
    expect(fs.writeText(root + "/tree/one.txt", "1").has_value());
    expect(fs.writeText(root + "/tree/a/two.log", "22").has_value());
    expect(fs.writeText(root + "/tree/a/b/three.log", "333").has_value());
  }
} // namespace

auto main() -> int {
  const Result<UniquePointer<Context>> created = Context::create();

  if (!created)
    return 1;

  const Context& ctx  = **created;
  const String   root = ScratchRoot();

  FileSystem fs(ctx);

  if (!fs.createDirectories(root))
    return 1;

  "Write then read returns the same bytes"_test = [&] -> void {
    const String path = root + "/hello.txt";

    expect(fs.writeText(path, "hello, conduit\n").has_value());
    expect(fs.readText(path) == String("hello, conduit\n"));

    const Result<FileStat> info = fs.stat(path);

    expect(info.has_value());
    expect(info && info->size == u64(15));
    expect(info && info->type == EntryType::File);
    expect(info && info->permissions.readable);
  };

  "Open modes"_test = [&] -> void {
    const String path = root + "/modes.txt";

    expect(fs.writeText(path, "abc").has_value());

    {
      Result<File> file = fs.open(path, OpenMode::Append);

      expect(file.has_value());
      if (file) {
        expect(file->writeAll("def").has_value());
        expect(file->close().has_value());
        expect(!file->close().has_value());
      }
    }

    expect(fs.readText(path) == String("abcdef"));

    const Result<File> exclusive = fs.open(path, OpenMode::Write | OpenMode::Create | OpenMode::Exclusive);

    expect(!exclusive && exclusive.error().kind == ErrorKind::InvalidArgument);

    const Result<File> noAccess = fs.open(path, OpenMode::Create);

    expect(!noAccess && noAccess.error().kind == ErrorKind::InvalidArgument);
  };

  "Seek and partial reads"_test = [&] -> void {
    const String path = root + "/seek.bin";

    expect(fs.writeText(path, "0123456789").has_value());

    Result<File> file = fs.open(path, OpenMode::Read);

    expect(file.has_value());
    if (!file)
      return;

    expect(file->seek(4) == u64(4));

    Array<u8, 3> buffer {};

    expect(file->read(buffer) == usize(3));
    expect(buffer[0] == '4' && buffer[2] == '6');
    expect(file->seek(-2, SeekOrigin::End) == u64(8));

    const Result<Bytes> rest = file->readAll();

    expect(rest && String(rest->begin(), rest->end()) == String("89"));
  };

  "Missing paths are NotFound"_test = [&] -> void {
    const String missing = root + "/does/not/exist";

    expect(fs.readFile(missing).error().kind == ErrorKind::NotFound);
    expect(fs.stat(missing).error().kind == ErrorKind::NotFound);
    expect(fs.remove(missing).error().kind == ErrorKind::NotFound);
    expect(fs.removeAll(missing).error().kind == ErrorKind::NotFound);
    expect(fs.exists(missing) == false);
    expect(fs.exists(root) == true);
  };

  "Invalid paths are rejected before reaching the OS"_test = [&] -> void {
    expect(fs.readFile("").error().kind == ErrorKind::InvalidArgument);
    expect(fs.readFile("dir\\file").error().kind == ErrorKind::InvalidArgument);
  };

  "Listing is sorted and excludes dot entries"_test = [&] -> void {
    const String dir = root + "/list";

    expect(fs.createDirectory(dir).has_value());
    expect(fs.writeText(dir + "/b.txt", "").has_value());
    expect(fs.writeText(dir + "/a.txt", "").has_value());
    expect(fs.createDirectory(dir + "/c").has_value());

    const Result<Vec<DirEntry>> entries = fs.list(dir);

    expect(entries.has_value());
    expect(entries && *entries == Vec<DirEntry> {
      { .name = "a.txt", .type = EntryType::File },
      { .name = "b.txt", .type = EntryType::File },
      { .name = "c", .type = EntryType::Directory },
    });
  };

  "Removing a non-empty directory fails"_test = [&] -> void {
    const String dir = root + "/full";

    expect(fs.createDirectories(dir + "/inner").has_value());

    const Result<> removed = fs.remove(dir);

    expect(!removed && removed.error().kind == ErrorKind::InvalidArgument);
    expect(fs.exists(dir + "/inner") == true);
  };

  "createDirectories is idempotent"_test = [&] -> void {
    const String dir = root + "/deep/er/est";

    expect(fs.createDirectories(dir).has_value());
    expect(fs.createDirectories(dir).has_value());
    expect(fs.stat(dir)->type == EntryType::Directory);

    expect(fs.writeText(root + "/deep/file", "x").has_value());
    expect(fs.createDirectories(root + "/deep/file/below").error().kind == ErrorKind::InvalidArgument);
  };

  "Rename replaces the target"_test = [&] -> void {
    expect(fs.writeText(root + "/from.txt", "new").has_value());
    expect(fs.writeText(root + "/to.txt", "old").has_value());
    expect(fs.rename(root + "/from.txt", root + "/to.txt").has_value());
    expect(fs.readText(root + "/to.txt") == String("new"));
    expect(fs.exists(root + "/from.txt") == false);
  };

  "Copy honours overwrite"_test = [&] -> void {
    expect(fs.writeText(root + "/copy-src", "payload").has_value());

    expect(fs.copy(root + "/copy-src", root + "/copy-dst") == u64(7));
    expect(fs.readText(root + "/copy-dst") == String("payload"));

    const Result<u64> refused = fs.copy(root + "/copy-src", root + "/copy-dst");

    expect(!refused && refused.error().kind == ErrorKind::InvalidArgument);
    expect(fs.copy(root + "/copy-src", root + "/copy-dst", true) == u64(7));
  };

  "Copying a file onto itself keeps its contents"_test = [&] -> void {
    const UniquePointer<Context> emulatedCtx = WithoutNative({ ops::FileCopy });
    FileSystem                   emulated(*emulatedCtx);

    const String path = root + "/self-copy.txt";

    expect(fs.writeText(path, "precious").has_value());

    const Result<u64> native = fs.copy(path, path, true);

    expect(!native && native.error().kind == ErrorKind::InvalidArgument);
    expect(fs.readText(path) == String("precious"));

    const Result<u64> fallback = emulated.copy(path, root + "/./self-copy.txt", true);

    expect(!fallback && fallback.error().kind == ErrorKind::InvalidArgument);
    expect(fs.readText(path) == String("precious"));

#ifndef _WIN32
    const Result<FileStat> direct = fs.stat(path);
    const Result<FileStat> dotted = fs.stat(root + "/./self-copy.txt");

    expect(direct && direct->identity.has_value());
    expect(direct && dotted && direct->identity == dotted->identity);
#endif
  };

  "Permissions"_test = [&] -> void {
    const String path = root + "/perm.txt";

    expect(fs.writeText(path, "x").has_value());
    expect(fs.setPermissions(path, { .readable = true, .writable = false, .executable = false }).has_value());
    expect(fs.stat(path)->permissions.writable == false);
    expect(fs.setPermissions(path, { .readable = true, .writable = true, .executable = false }).has_value());
    expect(fs.stat(path)->permissions.writable == true);
  };

  "find matches names recursively"_test = [&] -> void {
    Seed(fs, root + "/find");

    const Result<Vec<String>> logs = fs.find(root + "/find", "*.log");

    expect(logs.has_value());
    expect(logs && *logs == Vec<String> { root + "/find/tree/a/b/three.log", root + "/find/tree/a/two.log" });

    expect(fs.find(root + "/find", "").error().kind == ErrorKind::InvalidArgument);
  };

  "Native and emulated tree removal agree"_test = [&] -> void {
    const UniquePointer<Context> emulatedCtx = WithoutNative({ ops::FileRemoveAll });
    FileSystem                   emulated(*emulatedCtx);

    Seed(fs, root + "/native");
    Seed(fs, root + "/emulated");

    const Result<u64> native   = fs.removeAll(root + "/native");
    const Result<u64> fallback = emulated.removeAll(root + "/emulated");

    // tree, a, b, one.txt, two.log, three.log plus the root itself.
    expect(native == u64(7));
    expect(fallback == u64(7));
    expect(fs.exists(root + "/native") == false);
    expect(fs.exists(root + "/emulated") == false);
  };

  "Native and emulated copy agree"_test = [&] -> void {
    const UniquePointer<Context> emulatedCtx = WithoutNative({ ops::FileCopy });
    FileSystem                   emulated(*emulatedCtx);

    String payload(200'000, 'z');
    expect(fs.writeText(root + "/big", payload).has_value());

    expect(fs.copy(root + "/big", root + "/big-native") == u64(payload.size()));
    expect(emulated.copy(root + "/big", root + "/big-emulated") == u64(payload.size()));
    expect(fs.readText(root + "/big-emulated") == payload);

    const Result<u64> refused = emulated.copy(root + "/big", root + "/big-emulated");

    expect(!refused && refused.error().kind == ErrorKind::InvalidArgument);
    expect(emulated.copy(root, root + "/dir-copy").error().kind == ErrorKind::InvalidArgument);
  };

  "sync succeeds natively and through the no-op fallback"_test = [&] -> void {
    const UniquePointer<Context> noSyncCtx = WithoutNative({ ops::FileSync });
    FileSystem                   noSync(*noSyncCtx);

    for (FileSystem* adapter : { &fs, &noSync }) {
      Result<File> file = adapter->create(root + "/synced");

      expect(file.has_value());
      if (!file)
        continue;

      expect(file->writeAll("data").has_value());
      expect(file->sync().has_value());
    }
  };

  "Normalize goes through the path rules"_test = [&] -> void {
    expect(fs.normalize("a/./b/../c") == String("a/c"));
  };

  return fs.removeAll(root) ? 0 : 1;
}
