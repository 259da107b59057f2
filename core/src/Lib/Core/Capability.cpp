#include <format>                    // std::format
#include <initializer_list>          // std::initializer_list
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <Conduit++/Core/Capability.hpp>
#include <Conduit++/Core/Operations.hpp>
#include <Conduit++/Utils/Error.hpp>
#include <Conduit++/Utils/Logging.hpp>

using namespace conduit::utils::types;
using conduit::utils::error::ErrorKind;

namespace {
  using conduit::core::capability::BackendId;
  using conduit::core::capability::CapabilityDescriptor;
  using conduit::core::capability::CapabilityEntry;
  using conduit::core::capability::FallbackPolicy;
  using conduit::core::platform::Capability;
  using conduit::core::platform::PlatformFamily;

  namespace ops = conduit::core::ops;

  constexpr Array<PlatformFamily, 7> PosixFamilies = {
    PlatformFamily::Linux,
    PlatformFamily::MacOS,
    PlatformFamily::FreeBSD,
    PlatformFamily::NetBSD,
    PlatformFamily::OpenBSD,
    PlatformFamily::DragonFly,
    PlatformFamily::Haiku,
  };

  auto On(const PlatformFamily family, const BackendId backend, const Capability required = Capability::None) -> CapabilityEntry {
    return { .family = family, .major = None, .minor = None, .backend = backend, .required = required };
  }

  auto Unavailable(const PlatformFamily family, const u32 major, const Option<u32> minor = None) -> CapabilityEntry {
    return { .family = family, .major = major, .minor = minor, .backend = None, .required = Capability::None };
  }

  /// Every POSIX family through the portable backend, Windows through Win32.
  auto Everywhere(const Capability posixRequires = Capability::None) -> Vec<CapabilityEntry> {
    Vec<CapabilityEntry> entries;
    entries.reserve(PosixFamilies.size() + 1);

    for (const PlatformFamily family : PosixFamilies)
      entries.push_back(On(family, BackendId::Posix, posixRequires));

    entries.push_back(On(PlatformFamily::Windows, BackendId::Windows));
    return entries;
  }

  auto Descriptor(const StringView operation, Vec<CapabilityEntry> entries, const FallbackPolicy fallback = FallbackPolicy::Error, String note = {}) -> CapabilityDescriptor {
    return { .operation = String(operation), .entries = std::move(entries), .fallback = fallback, .note = std::move(note), .prerequisites = {} };
  }

  auto Emulated(const StringView operation, Vec<CapabilityEntry> entries, String note, const std::initializer_list<StringView> prerequisites) -> CapabilityDescriptor {
    CapabilityDescriptor descriptor = Descriptor(operation, std::move(entries), FallbackPolicy::Emulate, std::move(note));

    for (const StringView prerequisite : prerequisites)
      descriptor.prerequisites.emplace_back(prerequisite);

    return descriptor;
  }
} // namespace

namespace conduit::core::capability {
  auto CapabilityEntry::matches(const platform::PlatformProfile& profile) const -> bool {
    if (family != profile.family)
      return false;

    if (major) {
      if (*major != profile.version.major)
        return false;

      if (minor && *minor != profile.version.minor)
        return false;
    }

    return platform::HasCapabilities(profile.capabilities, required);
  }

  auto Describe(const Resolution& resolution) -> String {
    if (const auto* supported = std::get_if<Supported>(&resolution))
      return std::format("Supported({})", magic_enum::enum_name(supported->backend));

    if (const auto* fallback = std::get_if<Fallback>(&resolution))
      return std::format("Fallback({})", magic_enum::enum_name(fallback->policy));

    return std::format("Unsupported({})", std::get<Unsupported>(resolution).reason);
  }

  CapabilityRegistry::CapabilityRegistry(Vec<CapabilityDescriptor> table) : m_descriptors(std::move(table)) {
    m_index.reserve(m_descriptors.size());

    for (usize i = 0; i < m_descriptors.size(); ++i)
      if (!m_index.try_emplace(m_descriptors[i].operation, i).second)
        warn_log("Duplicate capability descriptor for '{}'; keeping the first", m_descriptors[i].operation);
  }

  auto CapabilityRegistry::withDefaults() -> CapabilityRegistry {
    return CapabilityRegistry(defaultTable());
  }

  auto CapabilityRegistry::defaultTable() -> Vec<CapabilityDescriptor> {
    using enum PlatformFamily;
    using enum FallbackPolicy;

    Vec<CapabilityDescriptor> table;

    table.push_back(Descriptor(ops::FileOpen, Everywhere()));
    table.push_back(Descriptor(ops::FileStat, Everywhere()));
    table.push_back(Descriptor(ops::FileList, Everywhere()));
    table.push_back(Descriptor(ops::FileRemove, Everywhere()));
    table.push_back(Descriptor(ops::FileRename, Everywhere()));
    table.push_back(Descriptor(ops::FileCreateDir, Everywhere()));
    table.push_back(Descriptor(ops::FileSetPermissions, Everywhere(), Error, "Windows maps only 'writable' (read-only attribute)"));
    table.push_back(Descriptor(ops::FileSync, Everywhere(), NoOp, "data may remain in the OS write cache"));

    // nftw-based tree removal; Haiku and Windows rebuild it from list + remove.
    table.push_back(Emulated(
      ops::FileRemoveAll,
      {
        On(Linux, BackendId::Posix),
        On(MacOS, BackendId::Posix),
        On(FreeBSD, BackendId::Posix),
        On(NetBSD, BackendId::Posix),
        On(OpenBSD, BackendId::Posix),
        On(DragonFly, BackendId::Posix),
      },
      "entries are removed one by one, deepest first",
      { ops::FileStat, ops::FileList, ops::FileRemove }
    ));

    // copy_file_range(2) first appeared in Linux 4.5.
    table.push_back(Emulated(
      ops::FileCopy,
      {
        On(Linux, BackendId::Linux),
        Unavailable(Linux, 2),
        Unavailable(Linux, 3),
        Unavailable(Linux, 4, 0),
        Unavailable(Linux, 4, 1),
        Unavailable(Linux, 4, 2),
        Unavailable(Linux, 4, 3),
        Unavailable(Linux, 4, 4),
        On(MacOS, BackendId::Darwin),
        On(Windows, BackendId::Windows),
      },
      "contents are streamed through user space; permissions are copied, other metadata is not",
      { ops::FileStat, ops::FileOpen, ops::FileSetPermissions }
    ));

    table.push_back(Emulated(ops::FileFind, {}, "recursive list + wildcard match", { ops::FileList }));

    table.push_back(Descriptor(ops::ProcessSpawn, Everywhere()));
    table.push_back(Descriptor(ops::ProcessWait, Everywhere()));
    table.push_back(Descriptor(ops::ProcessSignalTerminate, Everywhere()));
    table.push_back(Descriptor(ops::ProcessSignalKill, Everywhere()));
    table.push_back(Descriptor(ops::ProcessSignalInterrupt, Everywhere()));

    {
      Vec<CapabilityEntry> custom;
      for (const PlatformFamily family : PosixFamilies)
        custom.push_back(On(family, BackendId::Posix, Capability::PosixSignals));

      table.push_back(Descriptor(ops::ProcessSignalCustom, std::move(custom)));
    }

    table.push_back(Descriptor(ops::NetConnect, Everywhere()));
    table.push_back(Descriptor(ops::NetListen, Everywhere()));
    table.push_back(Descriptor(ops::NetOptionTimeout, Everywhere()));
    table.push_back(Descriptor(ops::NetOptionKeepAlive, Everywhere()));
    table.push_back(Descriptor(ops::NetOptionBufferSize, Everywhere()));
    table.push_back(Descriptor(ops::NetOptionRecvBuffer, Everywhere()));
    table.push_back(Descriptor(ops::NetOptionSendBuffer, Everywhere()));

    {
      Vec<CapabilityEntry> native;
      for (const PlatformFamily family : PosixFamilies)
        native.push_back(On(family, BackendId::Posix, Capability::Syslog));

      native.push_back(On(Windows, BackendId::Windows, Capability::EventLog));

      table.push_back(Descriptor(ops::LogNative, std::move(native), NoOp, "entries for the native log are dropped"));
    }

    table.push_back(Descriptor(ops::MonitorCpuTime, Everywhere()));

    table.push_back(Descriptor(
      ops::MonitorMemory,
      {
        On(Linux, BackendId::Linux, Capability::ProcFs),
        On(MacOS, BackendId::Darwin),
        On(Windows, BackendId::Windows),
      }
    ));

    table.push_back(Descriptor(
      ops::MonitorSystemMemory,
      {
        On(Linux, BackendId::Linux),
        On(MacOS, BackendId::Darwin),
        On(Windows, BackendId::Windows),
      }
    ));

    table.push_back(Descriptor(
      ops::MonitorIo,
      {
        On(Linux, BackendId::Linux, Capability::ProcFs),
        On(MacOS, BackendId::Darwin),
        On(Windows, BackendId::Windows),
      }
    ));

    return table;
  }

  auto CapabilityRegistry::withOverrides(const Map<String, FallbackPolicy>& overrides) const -> Result<CapabilityRegistry> {
    Vec<CapabilityDescriptor> table = m_descriptors;

    for (const auto& [operation, policy] : overrides) {
      const auto iter = m_index.find(operation);

      if (iter == m_index.end())
        ERR_FMT(ErrorKind::InvalidArgument, "Fallback override names unknown operation '{}'", operation);

      table[iter->second].fallback = policy;

      debug_log("Fallback policy for '{}' overridden to {}", operation, magic_enum::enum_name(policy));
    }

    return CapabilityRegistry(std::move(table));
  }

  auto CapabilityRegistry::find(const StringView operation) const -> const CapabilityDescriptor* {
    const auto iter = m_index.find(String(operation));

    return iter == m_index.end() ? nullptr : &m_descriptors[iter->second];
  }

  auto CapabilityRegistry::operations() const -> Vec<StringView> {
    Vec<StringView> names;
    names.reserve(m_descriptors.size());

    for (const CapabilityDescriptor& descriptor : m_descriptors)
      names.emplace_back(descriptor.operation);

    return names;
  }

  auto CapabilityRegistry::nativeBackend(const CapabilityDescriptor& descriptor, const platform::PlatformProfile& profile) const -> Option<BackendId> {
    const CapabilityEntry* best = nullptr;

    for (const CapabilityEntry& entry : descriptor.entries)
      if (entry.matches(profile) && (best == nullptr || entry.specificity() > best->specificity()))
        best = &entry;

    return best != nullptr ? best->backend : None;
  }

  auto CapabilityRegistry::resolve(const StringView operation, const platform::PlatformProfile& profile) const -> Resolution {
    const CapabilityDescriptor* descriptor = find(operation);

    if (descriptor == nullptr)
      return Unsupported { std::format("unknown operation '{}'", operation) };

    if (const Option<BackendId> backend = nativeBackend(*descriptor, profile))
      return Supported { *backend };

    switch (descriptor->fallback) {
      case FallbackPolicy::Emulate: {
        for (const String& prerequisite : descriptor->prerequisites) {
          const CapabilityDescriptor* required = find(prerequisite);

          if (required == nullptr || !nativeBackend(*required, profile))
            return Unsupported { std::format("'{}' is emulated from '{}', which is not available on {}", operation, prerequisite, platform::FamilyName(profile.family)) };
        }

        return Fallback { FallbackPolicy::Emulate };
      }
      case FallbackPolicy::NoOp:
        if (profile.family != platform::PlatformFamily::Unknown)
          return Fallback { FallbackPolicy::NoOp };
        break;
      case FallbackPolicy::Error: break;
    }

    return Unsupported {
      std::format(
        "'{}' is not available on {} {}.{}.{}",
        operation,
        platform::FamilyName(profile.family),
        profile.version.major,
        profile.version.minor,
        profile.version.patch
      )
    };
  }
} // namespace conduit::core::capability
