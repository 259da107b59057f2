#pragma once

#ifdef _WIN32
  #include <stdlib.h> // NOLINT(*-deprecated-headers) - _dupenv_s, _putenv_s
  #include <windows.h> // GetEnvironmentStringsW, FreeEnvironmentStringsW
#endif

#include <cstdlib> // std::getenv

#include "Error.hpp"
#include "Types.hpp"

#ifndef _WIN32
extern char** environ; // NOLINT(readability-redundant-declaration)
#endif

namespace conduit::utils::env {
  namespace types = ::conduit::utils::types;
  namespace error = ::conduit::utils::error;

  using enum error::ErrorKind;

#ifdef _WIN32
  /**
   * @brief Reads an environment variable.
   * @return The value, or NotFound when the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
    char*        raw        = nullptr;
    types::usize bufferSize = 0;

    const types::i32 err = _dupenv_s(&raw, &bufferSize, name);

    const types::UniquePointer<char, decltype(&free)> owner(raw, free);

    if (err != 0)
      ERR_FMT(PermissionDenied, "Failed to read environment variable '{}'", name);

    if (!owner)
      ERR_FMT(NotFound, "Environment variable '{}' is not set", name);

    return types::String(owner.get());
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
    _putenv_s(name, value);
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Unit {
    _putenv_s(name, "");
  }

  /**
   * @brief Snapshots the whole environment block of the current process.
   */
  [[nodiscard]] inline auto GetEnvironment() -> types::Map<types::String, types::String> {
    types::Map<types::String, types::String> vars;

    wchar_t* block = GetEnvironmentStringsW();

    if (block == nullptr)
      return vars;

    for (const wchar_t* entry = block; *entry != L'\0'; entry += wcslen(entry) + 1) {
      const types::WStringView view(entry);
      // Entries such as "=C:=C:\\dir" start with '=' and are per-drive cwd markers.
      const types::usize eq = view.find(L'=', 1);

      if (eq == types::WStringView::npos)
        continue;

      const auto narrow = [](types::WStringView wide) -> types::String {
        const int size = WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), nullptr, 0, nullptr, nullptr);
        types::String out(static_cast<types::usize>(size), '\0');
        WideCharToMultiByte(CP_UTF8, 0, wide.data(), static_cast<int>(wide.size()), out.data(), size, nullptr, nullptr);
        return out;
      };

      vars.insert_or_assign(narrow(view.substr(0, eq)), narrow(view.substr(eq + 1)));
    }

    FreeEnvironmentStringsW(block);
    return vars;
  }
#else
  /**
   * @brief Reads an environment variable.
   * @return The value, or NotFound when the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(const types::PCStr name) -> types::Result<types::String> {
    const types::PCStr value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' is not set", name);

    return types::String(value);
  }

  inline auto SetEnv(const types::PCStr name, const types::PCStr value) -> types::Unit {
    setenv(name, value, 1);
  }

  inline auto UnsetEnv(const types::PCStr name) -> types::Unit {
    unsetenv(name);
  }

  [[nodiscard]] inline auto GetEnvironment() -> types::Map<types::String, types::String> {
    types::Map<types::String, types::String> vars;

    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
      const types::StringView view(*entry);

      if (const types::usize eq = view.find('='); eq != types::StringView::npos)
        vars.insert_or_assign(types::String(view.substr(0, eq)), types::String(view.substr(eq + 1)));
    }

    return vars;
  }
#endif
} // namespace conduit::utils::env
