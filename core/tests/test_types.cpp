#include <boost/ut.hpp>

#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Types.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace conduit::utils::types;

  using conduit::utils::error::ConduitError;
  using conduit::utils::error::ErrorKind;

  "Fixed-width aliases"_test = [] -> void {
    static_assert(sizeof(u8) == 1 && sizeof(i8) == 1);
    static_assert(sizeof(u16) == 2 && sizeof(i16) == 2);
    static_assert(sizeof(u32) == 4 && sizeof(i32) == 4);
    static_assert(sizeof(u64) == 8 && sizeof(i64) == 8);
    static_assert(sizeof(f64) == 8);
    static_assert(std::is_signed_v<isize> && !std::is_signed_v<usize>);
  };

  "Some wraps a decayed value"_test = [] -> void {
    const String label  = "socket";
    const auto   copied = Some(label);

    static_assert(std::is_same_v<decltype(copied), const Option<String>>);

    expect(copied == Some(String("socket")));
    expect(Option<i32>(None) == None);
  };

  "Result carries a value or a ConduitError"_test = [] -> void {
    const Result<u64> written = u64(512);
    const Result<u64> failed  = Err(ConduitError(ErrorKind::ResourceBusy, "file is locked", 32));

    expect(written == u64(512));
    expect(!failed.has_value());
    expect(failed.error().kind == ErrorKind::ResourceBusy);
    expect(failed.error().nativeCode == Some(i64(32)));
    expect(failed.value_or(0) == u64(0));
  };

  "Result<> models a bare success"_test = [] -> void {
    const Result<> done {};
    const Result<> refused = Err(ConduitError(ErrorKind::PermissionDenied, "read-only"));

    expect(done.has_value());
    expect(!refused.has_value() && refused.error().message == String("read-only"));
  };

  "Bytes and Span share storage"_test = [] -> void {
    Bytes           buffer(8, 0);
    const Span<u8>  view(buffer);
    const Span<u8>  tail = view.subspan(6);

    tail[0] = 0xAB;

    expect(tail.size() == usize(2));
    expect(buffer[6] == u8(0xAB));
  };

  "Millis is the API duration"_test = [] -> void {
    const Millis timeout = std::chrono::seconds(2);

    expect(timeout.count() == i64(2000));
  };

  "Map supports heterogeneous lookup"_test = [] -> void {
    const Map<String, i32> overrides { { "file.remove_all", 1 }, { "file.copy", 2 } };

    expect(overrides.find(StringView("file.copy")) != overrides.end());
    expect(overrides.begin()->first == String("file.copy"));
  };

  "UnorderedMap"_test = [] -> void {
    UnorderedMap<String, usize> index;
    index["file.open"] = 0;
    index["net.connect"] = 1;

    expect(index.size() == usize(2));
    expect(index.at("net.connect") == usize(1));
    expect(!index.contains("file.teleport"));
  };

  return 0;
}
