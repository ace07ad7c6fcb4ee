/*****************************************************************/ /**
 * @file   contracts.h
 * @brief  Contains macros for assertions, pre/post conditions.
 *
 * A violated contract is a bug in the caller: the default handler prints
 * the failing expression, its source location and a stack trace, then
 * aborts. Tests may register a handler that records violations instead.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_CONTRACTS_CONTRACTS
#define __HG_THINIO_CONTRACTS_CONTRACTS

#include "thinio_contracts_export.h"
#include "thinio_contracts_config.h"
#include <cstdint>
#include <optional>
#include <source_location>
#include <type_traits>

#ifdef THINIO_NO_SOURCE_LOCATION
  /// @brief The current source location
  #define THINIO_CURRENT_SOURCE_LOCATION std::source_location()
#else
  /// @brief The current source location
  #define THINIO_CURRENT_SOURCE_LOCATION std::source_location::current()
#endif // THINIO_NO_SOURCE_LOCATION

namespace thinio::contracts
{
  /// @brief The contract kind
  enum class Kind : unsigned char
  {
    /// @brief Precondition
    Pre,
    /// @brief Postcondition
    Post,
    /// @brief Assertion
    Assert,
  };

  /// @brief Returns a human readable name for a contract kind
  /// @param kind The kind
  /// @return "precondition", "postcondition" or "assertion"
  constexpr const char* to_string(Kind kind) noexcept
  {
    switch (kind)
    {
    case Kind::Pre:
      return "precondition";
    case Kind::Post:
      return "postcondition";
    default:
      return "assertion";
    }
  }

  // The functions below are not constexpr: calling one of them during
  // constant evaluation halts compilation, and its name shows in the error.

  /// @brief Called when a precondition fails at compile-time
  inline void precondition_failed_in_constexpr()
  {
    // A precondition failed at compile-time!
  }
  /// @brief Called when a postcondition fails at compile-time
  inline void postcondition_failed_in_constexpr()
  {
    // A postcondition failed at compile-time!
  }
  /// @brief Called when an assertion fails at compile-time
  inline void assertion_failed_in_constexpr()
  {
    // An assertion failed at compile-time!
  }
  /// @brief Called when a contract of unknown kind fails at compile-time
  inline void handler_failed_in_constexpr()
  {
    // A contract failed at compile-time!
  }

  /// @brief The type of a violation handler function
  using violation_handler_fn_t = void(
      const char*, const char*, Kind,
      const std::optional<std::source_location>&) noexcept;

  [[noreturn]] THINIO_CONTRACTS_EXPORT
      /// @brief The default runtime contract violation handler.
      /// Prints a stack trace and source code information, then aborts.
      /// @param expr The expression as a string
      /// @param explanation The explanation
      /// @param kind The kind of the violation
      /// @param loc The source location
      void
      default_runtime_violation_handler(
          const char* expr, const char* explanation, Kind kind,
          const std::optional<std::source_location>& loc) noexcept;

  THINIO_CONTRACTS_EXPORT
  /// @brief Calls the registered violation handler, or the default one.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The kind of the violation
  /// @param loc The source location
  void runtime_violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc) noexcept;

  /// @brief The contract violation handler.
  /// At compile-time only a compilation error can be generated.
  /// At runtime, calls the runtime violation handler.
  /// @param expr The expression as a string
  /// @param explanation The explanation
  /// @param kind The violation kind
  /// @param loc The source code location
  constexpr void violation_handler(
      const char* expr, const char* explanation, Kind kind,
      const std::optional<std::source_location>& loc =
          THINIO_CURRENT_SOURCE_LOCATION) noexcept
  {
    using enum Kind;

    if (std::is_constant_evaluated())
    {
      switch (kind)
      {
      case Pre:
        precondition_failed_in_constexpr();
        break;
      case Post:
        postcondition_failed_in_constexpr();
        break;
      case Assert:
        assertion_failed_in_constexpr();
        break;
      default:
        handler_failed_in_constexpr();
        break;
      }
    }
    else
    {
      runtime_violation_handler(expr, explanation, kind, loc);
    }
  }

  THINIO_CONTRACTS_EXPORT
  /// @brief Replaces the current violation handler.
  /// A handler that returns makes the failing check a no-op: only tests
  /// should register such a handler.
  /// @param fn The new violation handler, or nullptr for the default one
  /// @return The previously registered handler (nullptr if default)
  /// @note This function is thread safe.
  violation_handler_fn_t* register_violation_handler(
      violation_handler_fn_t* fn) noexcept;

  [[noreturn]] THINIO_CONTRACTS_EXPORT
      /// @brief Marks a branch as unreachable.
      /// Reaching it triggers a contract violation.
      /// @param loc The source location
      void
      unreachable(
          const std::source_location& loc =
              THINIO_CURRENT_SOURCE_LOCATION) noexcept;
} // namespace thinio::contracts

/// @brief Precondition (checks that `cond` evaluates to true)
#define THINIO_pre(cond, explanation)                        \
  do                                                         \
  {                                                          \
    if (!static_cast<bool>(cond))                            \
      thinio::contracts::violation_handler(                  \
          #cond, explanation, thinio::contracts::Kind::Pre); \
  } while (false)
/// @brief Postcondition (checks that `cond` evaluates to true)
#define THINIO_post(cond, explanation)                        \
  do                                                          \
  {                                                           \
    if (!static_cast<bool>(cond))                             \
      thinio::contracts::violation_handler(                   \
          #cond, explanation, thinio::contracts::Kind::Post); \
  } while (false)
/// @brief Assertion (checks that `cond` evaluates to true)
#define THINIO_assert(cond, explanation)                        \
  do                                                            \
  {                                                             \
    if (!static_cast<bool>(cond))                               \
      thinio::contracts::violation_handler(                     \
          #cond, explanation, thinio::contracts::Kind::Assert); \
  } while (false)

#ifdef THINIO_DEBUG
  /// @brief Precondition that is only evaluated on Debug config
  #define THINIO_debug_pre(cond, explanation) THINIO_pre(cond, explanation)
  /// @brief Assertion that is only evaluated on Debug config
  #define THINIO_debug_assert(cond, explanation) THINIO_assert(cond, explanation)
#else
  /// @brief Precondition that is only evaluated on Debug config
  #define THINIO_debug_pre(cond, explanation) \
    do                                        \
    {                                         \
    } while (false)
  /// @brief Assertion that is only evaluated on Debug config
  #define THINIO_debug_assert(cond, explanation) \
    do                                           \
    {                                            \
    } while (false)
#endif // THINIO_DEBUG

#endif // !__HG_THINIO_CONTRACTS_CONTRACTS
