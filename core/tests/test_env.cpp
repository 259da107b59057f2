#include <boost/ut.hpp>

#include <Conduit++/Utils/Env.hpp>

auto main() -> int {
  using namespace boost::ut;
  using namespace conduit::utils::env;
  using namespace conduit::utils::error;
  using namespace conduit::utils::types;

  "GetEnv returns NotFound for missing variable"_test = [] -> void {
    Result<String> result = GetEnv("CONDUIT_TEST_NONEXISTENT_VAR_12345");

    expect(!result.has_value());
    expect(result.error().kind == ErrorKind::NotFound);
  };

  "SetEnv and GetEnv round-trip"_test = [] -> void {
    SetEnv("CONDUIT_TEST_VAR", "test_value");
    Result<String> result = GetEnv("CONDUIT_TEST_VAR");

    expect(result.has_value());
    expect(*result == String("test_value"));

    UnsetEnv("CONDUIT_TEST_VAR");
  };

  "UnsetEnv removes variable"_test = [] -> void {
    SetEnv("CONDUIT_TEST_VAR2", "value");
    UnsetEnv("CONDUIT_TEST_VAR2");

    Result<String> result = GetEnv("CONDUIT_TEST_VAR2");

    expect(!result.has_value());
  };

  "GetEnvironment includes variables set at runtime"_test = [] -> void {
    SetEnv("CONDUIT_TEST_SNAPSHOT", "present");

    const Map<String, String> vars = GetEnvironment();

    const auto iter = vars.find("CONDUIT_TEST_SNAPSHOT");

    expect(iter != vars.end());
    expect(iter != vars.end() && iter->second == String("present"));

    UnsetEnv("CONDUIT_TEST_SNAPSHOT");
  };

  return 0;
}
