#include <algorithm> // std::ranges::replace
#include <cctype>    // std::isalpha, std::tolower
#include <ranges>    // std::views::split

#include <Conduit++/Files/Path.hpp>
#include <Conduit++/Utils/Error.hpp>

using namespace conduit::utils::types;
using enum conduit::utils::error::ErrorKind;
using conduit::core::platform::PlatformFamily;

namespace {
  constexpr StringView WindowsReserved = R"(<>"|?*)";

  auto HasDrivePrefix(const StringView path) -> bool {
    return path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) != 0 && path[1] == ':';
  }

  auto FoldCase(const char chr) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
} // namespace

namespace conduit::files::path {
  auto Validate(const StringView logical, const PlatformFamily family) -> Result<> {
    if (logical.empty())
      ERR(InvalidArgument, "Path is empty");

    for (usize i = 0; i < logical.size(); ++i) {
      const char chr = logical[i];

      if (chr == '\0')
        ERR(InvalidArgument, "Path contains a NUL byte");

      if (chr == '\\')
        ERR_FMT(InvalidArgument, "Path '{}' contains '\\'; logical paths use '/' as the only separator", logical);

      if (family != PlatformFamily::Windows)
        continue;

      if (static_cast<unsigned char>(chr) < 0x20)
        ERR_FMT(InvalidArgument, "Path '{}' contains a control character", logical);

      if (WindowsReserved.contains(chr))
        ERR_FMT(InvalidArgument, "Path '{}' contains reserved character '{}'", logical, chr);

      if (chr == ':' && !(i == 1 && HasDrivePrefix(logical)))
        ERR_FMT(InvalidArgument, "Path '{}' contains ':' outside a drive prefix", logical);
    }

    return {};
  }

  auto ToNative(const StringView logical, const PlatformFamily family) -> Result<String> {
    TRY_VOID(Validate(logical, family));

    String native(logical);

    if (family == PlatformFamily::Windows)
      std::ranges::replace(native, LogicalSeparator, core::platform::NativeSeparator(family));

    return native;
  }

  auto ToLogical(const StringView native, const PlatformFamily family) -> String {
    String logical(native);

    if (family == PlatformFamily::Windows)
      std::ranges::replace(logical, '\\', LogicalSeparator);

    return logical;
  }

  auto Normalize(const StringView logical) -> Result<String> {
    if (logical.empty())
      ERR(InvalidArgument, "Path is empty");

    if (logical.contains('\0') || logical.contains('\\'))
      ERR_FMT(InvalidArgument, "Path '{}' is not a logical path", logical);

    StringView rest = logical;
    String     result;

    if (HasDrivePrefix(rest)) {
      result.append(rest.substr(0, 2));
      rest.remove_prefix(2);
    }

    const bool absolute = rest.starts_with(LogicalSeparator);

    Vec<StringView> parts;

    for (auto segment : rest | std::views::split(LogicalSeparator)) {
      const StringView part(segment.begin(), segment.end());

      if (part.empty() || part == ".")
        continue;

      if (part == "..") {
        if (!parts.empty() && parts.back() != "..")
          parts.pop_back();
        else if (!absolute)
          parts.push_back(part);

        continue;
      }

      parts.push_back(part);
    }

    if (absolute)
      result += LogicalSeparator;

    for (usize i = 0; i < parts.size(); ++i) {
      if (i > 0)
        result += LogicalSeparator;
      result += parts[i];
    }

    if (result.empty())
      result = ".";

    return result;
  }

  auto Join(const StringView base, const StringView child) -> String {
    if (child.empty())
      return String(base);

    if (base.empty() || IsAbsolute(child))
      return String(child);

    String joined(base);

    if (!joined.ends_with(LogicalSeparator))
      joined += LogicalSeparator;

    joined += child;
    return joined;
  }

  auto IsAbsolute(const StringView logical) -> bool {
    if (logical.starts_with(LogicalSeparator))
      return true;

    return HasDrivePrefix(logical) && logical.size() >= 3 && logical[2] == LogicalSeparator;
  }

  auto FileName(const StringView logical) -> StringView {
    const usize pos = logical.find_last_of(LogicalSeparator);

    return pos == StringView::npos ? logical : logical.substr(pos + 1);
  }

  auto Parent(const StringView logical) -> StringView {
    const usize pos = logical.find_last_of(LogicalSeparator);

    if (pos == StringView::npos)
      return {};

    if (pos == 0)
      return logical.substr(0, 1);

    return logical.substr(0, pos);
  }

  auto MatchGlob(const StringView pattern, const StringView name, const bool caseSensitive) -> bool {
    usize patIdx = 0, nameIdx = 0;
    usize starIdx = StringView::npos, resumeIdx = 0;

    const auto same = [caseSensitive](const char lhs, const char rhs) -> bool {
      return caseSensitive ? lhs == rhs : FoldCase(lhs) == FoldCase(rhs);
    };

    while (nameIdx < name.size()) {
      if (patIdx < pattern.size() && (pattern[patIdx] == '?' || same(pattern[patIdx], name[nameIdx]))) {
        ++patIdx;
        ++nameIdx;
      } else if (patIdx < pattern.size() && pattern[patIdx] == '*') {
        starIdx   = patIdx++;
        resumeIdx = nameIdx;
      } else if (starIdx != StringView::npos) {
        patIdx    = starIdx + 1;
        nameIdx   = ++resumeIdx;
      } else
        return false;
    }

    while (patIdx < pattern.size() && pattern[patIdx] == '*')
      ++patIdx;

    return patIdx == pattern.size();
  }
} // namespace conduit::files::path
