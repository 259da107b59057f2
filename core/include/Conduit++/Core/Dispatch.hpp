/**
 * @file Dispatch.hpp
 * @brief Routes an abstract operation to its native backend or fallback.
 *
 * Every adapter entry point goes through Dispatch. The adapter supplies the
 * native call (given the resolved backend) and, where the operation has one,
 * its emulation or no-op result; Dispatch chooses between them from the
 * capability registry and enforces the error contract:
 *  - Supported: the native result is returned verbatim, error or not.
 *  - Fallback(Emulate): the emulation runs; without one the call is Unsupported.
 *  - Fallback(NoOp): the no-op result is returned and the skip is logged.
 *  - Unsupported: ErrorKind::Unsupported carrying the registry's reason.
 */

#pragma once

#include <type_traits> // std::is_void_v

#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "Capability.hpp"
#include "Context.hpp"

namespace conduit::core {
  namespace types = ::conduit::utils::types;

  template <typename T>
  struct Route {
    types::Fn<types::Result<T>(capability::BackendId)> native;
    types::Fn<types::Result<T>()>                       emulate = nullptr;
    types::Fn<types::Result<T>()>                       noop    = nullptr;
  };

  template <typename T>
  auto Dispatch(const Context& ctx, const types::StringView operation, const Route<T>& route) -> types::Result<T> {
    using utils::error::ErrorKind;

    const capability::Resolution resolution = ctx.resolve(operation);

    if (const auto* supported = std::get_if<capability::Supported>(&resolution)) {
      types::Result<T> result = route.native(supported->backend);

      if (!result)
        trace_log("{} failed natively: {}", operation, result.error());

      return result;
    }

    if (const auto* fallback = std::get_if<capability::Fallback>(&resolution)) {
      if (fallback->policy == capability::FallbackPolicy::Emulate) {
        if (!route.emulate)
          ERR_FMT(ErrorKind::Unsupported, "{} has no native backend on {} and cannot be emulated", operation, platform::FamilyName(ctx.profile().family));

        debug_log("{} is emulated on {}", operation, platform::FamilyName(ctx.profile().family));
        return route.emulate();
      }

      if (fallback->policy == capability::FallbackPolicy::NoOp) {
        debug_log("{} skipped (no-op fallback) on {}", operation, platform::FamilyName(ctx.profile().family));

        if (route.noop)
          return route.noop();

        if constexpr (std::is_void_v<T>)
          return {};
        else
          ERR_FMT(ErrorKind::Unsupported, "{} has no no-op result", operation);
      }
    }

    const auto* unsupported = std::get_if<capability::Unsupported>(&resolution);

    ERR(ErrorKind::Unsupported, unsupported != nullptr ? unsupported->reason : types::String(operation));
  }
} // namespace conduit::core
