/**
 * @file Types.hpp
 * @brief Short aliases for the standard vocabulary types used across Conduit++.
 *
 * Every public signature in the library is written in terms of these aliases,
 * so the spelling of a result, an optional or a byte buffer is the same in the
 * file, process, network and telemetry adapters.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::map (UnorderedMap)
#include <array>                    // std::array (Array)
#include <chrono>                   // std::chrono::{milliseconds, system_clock}
#include <cstdint>                  // std::{u}int{8,16,32,64}_t
#include <expected>                 // std::{expected, unexpected}
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::{shared_ptr, unique_ptr}
#include <mutex>                    // std::{mutex, lock_guard}
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace conduit::utils {
  namespace error {
    struct ConduitError;
  } // namespace error

  namespace types {
    // Fixed-width integers and floating point.
    using u8    = std::uint8_t;
    using u16   = std::uint16_t;
    using u32   = std::uint32_t;
    using u64   = std::uint64_t;
    using i8    = std::int8_t;
    using i16   = std::int16_t;
    using i32   = std::int32_t;
    using i64   = std::int64_t;
    using f32   = float;
    using f64   = double;
    using usize = std::size_t;
    using isize = std::ptrdiff_t;

    // Strings. Logical paths and messages are always UTF-8 `String`s; wide
    // strings only appear inside the Windows backends.
    using String      = std::string;
    using StringView  = std::string_view;
    using WString     = std::wstring;
    using WStringView = std::wstring_view;
    using CStr        = char;
    using PCStr       = const char*;
    using PWCStr      = const wchar_t*;

    using Unit       = void;
    using RawPointer = void*;
    using Exception  = std::exception;

    using Mutex     = std::mutex;
    using LockGuard = std::lock_guard<Mutex>;

    /// Durations are expressed in milliseconds at the API surface.
    using Millis = std::chrono::milliseconds;

    /// Wall-clock timestamp attached to log entries and telemetry samples.
    using Timestamp = std::chrono::system_clock::time_point;

    template <typename Tp>
    using Option = std::optional<Tp>;

    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Wraps a value in an engaged Option.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_cvref_t<Tp>> {
      return std::make_optional<std::remove_cvref_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    /// Owned byte buffer used by file and socket I/O.
    using Bytes = Vec<u8>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /// Ordered map with heterogeneous lookup (find by StringView on a String key).
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /// Open-addressing hash map; used for hot lookup tables such as the capability index.
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    template <typename Tp>
    using SharedPointer = std::shared_ptr<Tp>;

    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Either a success value of type Tp or a ConduitError. Never both.
     */
    template <typename Tp = Unit, typename Er = error::ConduitError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Constructs a Result in its error state.
     */
    template <typename Er = error::ConduitError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace conduit::utils
