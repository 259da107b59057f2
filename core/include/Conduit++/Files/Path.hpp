/**
 * @file Path.hpp
 * @brief Logical path handling shared by every file backend.
 *
 * @details The public API accepts and returns *logical* paths: UTF-8 strings
 * whose only separator is '/'. A logical path may be absolute ("/usr/bin",
 * "C:/Users") or relative ("logs/app.log"). Conversion to the native form is a
 * separator translation plus validation; it never resolves symlinks or touches
 * the filesystem. Lexical clean-up ("a//b/../c" -> "a/c") is a separate step,
 * Normalize(), so that ToLogical(ToNative(p)) == p holds for every valid p.
 */

#pragma once

#include "../Core/Platform.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace conduit::files::path {
  namespace types = ::conduit::utils::types;

  inline constexpr char LogicalSeparator = '/';

  /**
   * @brief Checks that a logical path can be represented on `family`.
   * @return InvalidArgument for an empty path, an embedded NUL, a backslash, or a
   *         character reserved by the target platform (`<>:"|?*` and control
   *         characters on Windows, except the drive colon).
   */
  auto Validate(types::StringView logical, core::platform::PlatformFamily family) -> types::Result<>;

  /**
   * @brief Converts a logical path to the native representation of `family`.
   */
  auto ToNative(types::StringView logical, core::platform::PlatformFamily family) -> types::Result<types::String>;

  /**
   * @brief Converts a native path (as returned by the OS) back to logical form.
   */
  auto ToLogical(types::StringView native, core::platform::PlatformFamily family) -> types::String;

  /**
   * @brief Lexically normalizes a logical path.
   *
   * Collapses repeated separators, removes "." segments, resolves ".." against
   * the preceding segment and drops a trailing separator. Leading ".." segments
   * of a relative path are kept; ".." above an absolute root is discarded.
   * An empty result becomes ".".
   */
  auto Normalize(types::StringView logical) -> types::Result<types::String>;

  /**
   * @brief Joins two logical paths. An absolute `child` replaces `base`.
   */
  auto Join(types::StringView base, types::StringView child) -> types::String;

  /**
   * @brief True for "/..." and drive-rooted "X:/..." paths.
   */
  auto IsAbsolute(types::StringView logical) -> bool;

  /**
   * @brief Final path component ("a/b/c.txt" -> "c.txt").
   */
  auto FileName(types::StringView logical) -> types::StringView;

  /**
   * @brief Everything before the final component ("a/b/c.txt" -> "a/b", "c.txt" -> "").
   */
  auto Parent(types::StringView logical) -> types::StringView;

  /**
   * @brief Shell-style wildcard match supporting `*` and `?`.
   * @param caseSensitive  When false, ASCII letters compare case-insensitively.
   */
  auto MatchGlob(types::StringView pattern, types::StringView name, bool caseSensitive = true) -> bool;
} // namespace conduit::files::path
