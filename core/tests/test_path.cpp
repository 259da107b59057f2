#include <boost/ut.hpp>

#include <Conduit++/Files/Path.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace conduit::files::path;
  using namespace conduit::utils::types;

  using conduit::core::platform::PlatformFamily;
  using conduit::utils::error::ErrorKind;

  "ToNative translates separators on Windows only"_test = [] -> void {
    expect(ToNative("C:/Users/me/file.txt", PlatformFamily::Windows) == String("C:\\Users\\me\\file.txt"));
    expect(ToNative("logs/app.log", PlatformFamily::Windows) == String("logs\\app.log"));
    expect(ToNative("/usr/local/bin", PlatformFamily::Linux) == String("/usr/local/bin"));
    expect(ToNative("/Users/me", PlatformFamily::MacOS) == String("/Users/me"));
  };

  "Native round trip preserves valid logical paths"_test = [] -> void {
    for (const PlatformFamily family : { PlatformFamily::Linux, PlatformFamily::Windows, PlatformFamily::MacOS, PlatformFamily::Haiku })
      for (const StringView logical : { "a/b/c", "/abs/path", "relative", "C:/drive/root", "with space/x.txt", "trailing/" }) {
        const Result<String> native = ToNative(logical, family);

        expect(native.has_value()) << logical;

        if (native)
          expect(ToLogical(*native, family) == String(logical)) << logical;
      }
  };

  "Reserved characters are rejected on Windows"_test = [] -> void {
    for (const StringView bad : { "a<b", "a>b", "what?", "star*", "pipe|", "quote\"", "ab:c", "C:/x:y" }) {
      const Result<String> native = ToNative(bad, PlatformFamily::Windows);

      expect(!native.has_value()) << bad;
      expect(!native && native.error().kind == ErrorKind::InvalidArgument) << bad;
    }

    expect(ToNative("what?", PlatformFamily::Linux).has_value());
    expect(ToNative("C:/ok", PlatformFamily::Windows).has_value());
  };

  "Invalid logical paths"_test = [] -> void {
    expect(!Validate("", PlatformFamily::Linux).has_value());
    expect(!Validate("back\\slash", PlatformFamily::Linux).has_value());
    expect(!Validate(StringView("nul\0byte", 8), PlatformFamily::Linux).has_value());
    expect(!Validate("ctl\x01", PlatformFamily::Windows).has_value());
    expect(Validate("ctl\x01", PlatformFamily::Linux).has_value());
  };

  "Normalize"_test = [] -> void {
    expect(Normalize("a//b/./c/") == String("a/b/c"));
    expect(Normalize("a/b/../c") == String("a/c"));
    expect(Normalize("../x/../../y") == String("../../y"));
    expect(Normalize("/../etc") == String("/etc"));
    expect(Normalize("C:/a/../../b") == String("C:/b"));
    expect(Normalize("a/..") == String("."));
    expect(Normalize("/") == String("/"));
    expect(!Normalize("").has_value());
    expect(!Normalize("a\\b").has_value());
  };

  "Join"_test = [] -> void {
    expect(Join("a", "b") == String("a/b"));
    expect(Join("a/", "b") == String("a/b"));
    expect(Join("a", "/abs") == String("/abs"));
    expect(Join("a", "C:/abs") == String("C:/abs"));
    expect(Join("", "b") == String("b"));
    expect(Join("a", "") == String("a"));
  };

  "Components"_test = [] -> void {
    expect(IsAbsolute("/x"));
    expect(IsAbsolute("D:/x"));
    expect(!IsAbsolute("D:x"));
    expect(!IsAbsolute("x/y"));

    expect(FileName("a/b/c.txt") == StringView("c.txt"));
    expect(FileName("c.txt") == StringView("c.txt"));
    expect(Parent("a/b/c.txt") == StringView("a/b"));
    expect(Parent("c.txt").empty());
    expect(Parent("/c.txt") == StringView("/"));
  };

  "Glob matching"_test = [] -> void {
    expect(MatchGlob("*.log", "app.log"));
    expect(MatchGlob("*.log", ".log"));
    expect(!MatchGlob("*.log", "app.log.1"));
    expect(MatchGlob("app-?.txt", "app-1.txt"));
    expect(!MatchGlob("app-?.txt", "app-10.txt"));
    expect(MatchGlob("*a*b*", "xxaYYbzz"));
    expect(MatchGlob("*", ""));
    expect(!MatchGlob("?", ""));
    expect(!MatchGlob("README", "readme"));
    expect(MatchGlob("README", "readme", false));
  };

  return 0;
}
