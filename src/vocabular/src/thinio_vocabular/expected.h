/*****************************************************************/ /**
 * @file   expected.h
 * @brief  Contains the `Expected` vocabulary type.
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_VOCABULARY_EXPECTED
#define __HG_THINIO_VOCABULARY_EXPECTED

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
#include <thinio_contracts/contracts.h>

namespace thinio
{
  /// @brief Tag struct for constructing errors in Expected
  struct unexpected_t
  {
  };

  /// @brief Tag object for constructing errors in Expected
  inline constexpr unexpected_t unexpected;

  /// @brief Tag struct for constructing an object in place
  struct in_place_t
  {
  };

  /// @brief Tag object for constructing an object in place
  inline constexpr in_place_t in_place;

  /// @brief A helper class that can hold either a value or an error.
  /// Example Usage:
  /// @code{.cpp}
  /// Expected<size_t, IoError> write(std::span<const std::byte> data)
  /// {
  ///   if (data.empty())
  ///     return size_t{0};
  ///   return {unexpected, IoError::other()};
  /// }
  /// @endcode
  /// @tparam ExpectedTy The expected type
  /// @tparam ErrorTy The error type
  template<typename ExpectedTy, typename ErrorTy>
  class Expected
  {
    /// @brief Buffer for both error type and expected value
    union
    {
      /// @brief The expected value (active when is_error_v == false)
      ExpectedTy expected;
      /// @brief The error value (active when is_error_v == true)
      ErrorTy error_v;
    };

    /// @brief True if an error is stored in the Expected
    bool is_error_v;

    constexpr void destroy_active() noexcept
    {
      if (is_error_v)
        std::destroy_at(&error_v);
      else
        std::destroy_at(&expected);
    }

  public:
    /// @brief Copy constructs an error in the Expected
    /// @param value The error to copy
    constexpr Expected(unexpected_t, const ErrorTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
      requires std::copy_constructible<ErrorTy>
        : is_error_v(true)
    {
      std::construct_at(&error_v, value);
    }

    /// @brief Move constructs an error in the Expected
    /// @param to_move The error to move
    constexpr Expected(unexpected_t, ErrorTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      std::construct_at(&error_v, std::move(to_move));
    }

    /// @brief Copy constructs an expected value in the Expected
    /// @param value The value to copy
    constexpr Expected(const ExpectedTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>)
      requires std::copy_constructible<ExpectedTy>
        : is_error_v(false)
    {
      std::construct_at(&expected, value);
    }

    /// @brief Move constructs an expected value in the Expected
    /// @param to_move The value to move
    constexpr Expected(ExpectedTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>)
        : is_error_v(false)
    {
      std::construct_at(&expected, std::move(to_move));
    }

    /// @brief Constructs the expected value in place
    /// @param ...args Argument pack forwarded to the constructor
    template<typename... Args>
    constexpr Expected(in_place_t, Args&&... args) noexcept(
        std::is_nothrow_constructible_v<ExpectedTy, Args...>)
        : is_error_v(false)
    {
      std::construct_at(&expected, std::forward<Args>(args)...);
    }

    /// @brief Copy constructs an Expected
    /// @param copy The Expected to copy
    constexpr Expected(const Expected& copy) noexcept(
        std::is_nothrow_copy_constructible_v<ExpectedTy>
        && std::is_nothrow_copy_constructible_v<ErrorTy>)
      requires std::copy_constructible<ExpectedTy> && std::copy_constructible<ErrorTy>
        : is_error_v(copy.is_error_v)
    {
      if (is_error_v)
        std::construct_at(&error_v, copy.error_v);
      else
        std::construct_at(&expected, copy.expected);
    }

    /// @brief Move constructs an Expected
    /// @param move The Expected to move
    constexpr Expected(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>
        && std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(move.is_error_v)
    {
      if (is_error_v)
        std::construct_at(&error_v, std::move(move.error_v));
      else
        std::construct_at(&expected, std::move(move.expected));
    }

    /// @brief Move assignment operator
    /// @param move The Expected to move
    /// @return Self
    constexpr Expected& operator=(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ExpectedTy>
        && std::is_nothrow_move_constructible_v<ErrorTy>)
    {
      if (&move == this)
        return *this;

      destroy_active();
      is_error_v = move.is_error_v;
      if (is_error_v)
        std::construct_at(&error_v, std::move(move.error_v));
      else
        std::construct_at(&expected, std::move(move.expected));
      return *this;
    }

    Expected& operator=(const Expected&) = delete;

    /// @brief Destructs the value/error contained in the Expected
    constexpr ~Expected() noexcept { destroy_active(); }

    /// @brief Check if the Expected contains an error
    /// @return True if the Expected contains an error
    constexpr bool is_error() const noexcept { return is_error_v; }
    /// @brief Check if the Expected contains an expected value
    /// @return True if the Expected contains an expected value
    constexpr bool is_expect() const noexcept { return !is_error_v; }
    /// @brief Same as is_error()
    constexpr bool operator!() const noexcept { return is_error_v; }
    /// @brief Same as is_expect()
    explicit constexpr operator bool() const noexcept { return !is_error_v; }

    constexpr const ExpectedTy* operator->() const noexcept
    {
      THINIO_pre(is_expect(), "Expected contained an error!");
      return &expected;
    }
    constexpr ExpectedTy* operator->() noexcept
    {
      THINIO_pre(is_expect(), "Expected contained an error!");
      return &expected;
    }
    constexpr const ExpectedTy& operator*() const& noexcept { return value(); }
    constexpr ExpectedTy& operator*() & noexcept { return value(); }
    constexpr ExpectedTy&& operator*() && noexcept { return std::move(*this).value(); }

    /// @brief Returns the stored Expected value.
    /// @pre is_expect()
    constexpr const ExpectedTy& value() const& noexcept
    {
      THINIO_pre(is_expect(), "Expected contained an error!");
      return expected;
    }
    /// @brief Returns the stored Expected value.
    /// @pre is_expect()
    constexpr ExpectedTy& value() & noexcept
    {
      THINIO_pre(is_expect(), "Expected contained an error!");
      return expected;
    }
    /// @brief Returns the stored Expected value.
    /// @pre is_expect()
    constexpr ExpectedTy&& value() && noexcept
    {
      THINIO_pre(is_expect(), "Expected contained an error!");
      return std::move(expected);
    }

    /// @brief Returns the stored error value.
    /// @pre is_error()
    constexpr const ErrorTy& error() const& noexcept
    {
      THINIO_pre(is_error(), "Expected did not contain an error!");
      return error_v;
    }
    /// @brief Returns the stored error value.
    /// @pre is_error()
    constexpr ErrorTy& error() & noexcept
    {
      THINIO_pre(is_error(), "Expected did not contain an error!");
      return error_v;
    }
    /// @brief Returns the stored error value.
    /// @pre is_error()
    constexpr ErrorTy&& error() && noexcept
    {
      THINIO_pre(is_error(), "Expected did not contain an error!");
      return std::move(error_v);
    }
  };

  /// @brief Expected that carries no value on success.
  /// @tparam ErrorTy The error type
  template<typename ErrorTy>
  class Expected<void, ErrorTy>
  {
    union
    {
      /// @brief Active when is_error_v == false
      char success_v;
      /// @brief The error value (active when is_error_v == true)
      ErrorTy error_v;
    };

    /// @brief True if an error is stored in the Expected
    bool is_error_v;

  public:
    /// @brief Constructs a success
    constexpr Expected() noexcept
        : success_v(0)
        , is_error_v(false)
    {
    }

    /// @brief Copy constructs an error in the Expected
    /// @param value The error to copy
    constexpr Expected(unexpected_t, const ErrorTy& value) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      std::construct_at(&error_v, value);
    }

    /// @brief Move constructs an error in the Expected
    /// @param to_move The error to move
    constexpr Expected(unexpected_t, ErrorTy&& to_move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
        : is_error_v(true)
    {
      std::construct_at(&error_v, std::move(to_move));
    }

    constexpr Expected(const Expected& copy) noexcept(
        std::is_nothrow_copy_constructible_v<ErrorTy>)
        : success_v(0)
        , is_error_v(copy.is_error_v)
    {
      if (is_error_v)
        std::construct_at(&error_v, copy.error_v);
    }

    constexpr Expected(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
        : success_v(0)
        , is_error_v(move.is_error_v)
    {
      if (is_error_v)
        std::construct_at(&error_v, std::move(move.error_v));
    }

    constexpr Expected& operator=(Expected&& move) noexcept(
        std::is_nothrow_move_constructible_v<ErrorTy>)
    {
      if (&move == this)
        return *this;
      if (is_error_v)
        std::destroy_at(&error_v);
      is_error_v = move.is_error_v;
      if (is_error_v)
        std::construct_at(&error_v, std::move(move.error_v));
      return *this;
    }

    Expected& operator=(const Expected&) = delete;

    constexpr ~Expected() noexcept
    {
      if (is_error_v)
        std::destroy_at(&error_v);
    }

    constexpr bool is_error() const noexcept { return is_error_v; }
    constexpr bool is_expect() const noexcept { return !is_error_v; }
    constexpr bool operator!() const noexcept { return is_error_v; }
    explicit constexpr operator bool() const noexcept { return !is_error_v; }

    /// @brief Returns the stored error value.
    /// @pre is_error()
    constexpr const ErrorTy& error() const& noexcept
    {
      THINIO_pre(is_error(), "Expected did not contain an error!");
      return error_v;
    }
    /// @brief Returns the stored error value.
    /// @pre is_error()
    constexpr ErrorTy& error() & noexcept
    {
      THINIO_pre(is_error(), "Expected did not contain an error!");
      return error_v;
    }
  };
} // namespace thinio

#endif // !__HG_THINIO_VOCABULARY_EXPECTED
