/**
 * @file Types.hpp
 * @brief Defines type aliases used throughout Almanac.
 *
 * Short names for the fixed-width integers, floating point types and the
 * standard library containers the project relies on.
 */

#pragma once

#include <array>         // std::array (Array)
#include <cstdint>       // std::{u,}int{8,16,32,64}_t
#include <functional>    // std::function (Fn)
#include <future>        // std::future (Future)
#include <map>           // std::map (Map)
#include <memory>        // std::shared_ptr and std::unique_ptr (SharedPointer, UniquePointer)
#include <mutex>         // std::mutex and std::lock_guard (Mutex, LockGuard)
#include <optional>      // std::optional (Option)
#include <span>          // std::span (Span)
#include <string>        // std::string (String)
#include <string_view>   // std::string_view (StringView)
#include <unordered_map> // std::unordered_map (UnorderedMap)
#include <utility>       // std::pair (Pair)
#include <vector>        // std::vector (Vec)

#include "Definitions.hpp"

namespace almanac::utils::types {
  using u8  = std::uint8_t;  ///< 8-bit unsigned integer.
  using u16 = std::uint16_t; ///< 16-bit unsigned integer.
  using u32 = std::uint32_t; ///< 32-bit unsigned integer.
  using u64 = std::uint64_t; ///< 64-bit unsigned integer.

  using i8  = std::int8_t;  ///< 8-bit signed integer.
  using i16 = std::int16_t; ///< 16-bit signed integer.
  using i32 = std::int32_t; ///< 32-bit signed integer.
  using i64 = std::int64_t; ///< 64-bit signed integer.

  using f32 = float;  ///< 32-bit floating-point number.
  using f64 = double; ///< 64-bit floating-point number.

  using usize = std::size_t;    ///< Unsigned size type (result of sizeof).
  using isize = std::ptrdiff_t; ///< Signed size type (result of pointer subtraction).

  using String     = std::string;      ///< Owning, mutable string.
  using StringView = std::string_view; ///< Non-owning view of a string.
  using CStr       = char*;            ///< Pointer to a mutable null-terminated string.
  using PCStr      = const char*;      ///< Pointer to a constant null-terminated string.

  using Unit       = void;           ///< Return type of functions that produce no value.
  using RawPointer = void*;          ///< A type-erased pointer.
  using Exception  = std::exception; ///< Standard exception type.

  using Mutex     = std::mutex;             ///< Mutex type for synchronization.
  using LockGuard = std::lock_guard<Mutex>; ///< RAII-style lock guard for mutexes.

  /**
   * @brief Alias for std::nullopt_t.
   *
   * Represents an empty optional value.
   */
  inline constexpr std::nullopt_t None = std::nullopt;

  /**
   * @brief Alias for std::optional<Tp>.
   * @tparam Tp The type of the potential value.
   */
  template <typename Tp>
  using Option = std::optional<Tp>;

  /**
   * @brief Wraps a value in an Option.
   * @param value The value to wrap.
   */
  template <typename Tp>
  constexpr fn Some(Tp&& value) -> Option<std::decay_t<Tp>> {
    return std::make_optional(std::forward<Tp>(value));
  }

  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  template <typename Tp, usize sz = std::dynamic_extent>
  using Span = std::span<Tp, sz>;

  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  template <typename Key, typename Val>
  using Map = std::map<Key, Val>;

  template <typename Key, typename Val>
  using UnorderedMap = std::unordered_map<Key, Val>;

  /**
   * @brief Alias for std::shared_ptr<Tp>.
   * @tparam Tp The type of the managed object.
   */
  template <typename Tp>
  using SharedPointer = std::shared_ptr<Tp>;

  /**
   * @brief Alias for std::unique_ptr<Tp, Dp>.
   * @tparam Tp The type of the managed object.
   * @tparam Dp The deleter type (defaults to std::default_delete<Tp>).
   */
  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;

  template <typename Tp>
  using Future = std::future<Tp>;

  /**
   * @brief Alias for std::function<Sig>.
   * @tparam Sig The call signature.
   */
  template <typename Sig>
  using Fn = std::function<Sig>;
} // namespace almanac::utils::types
