/*****************************************************************/ /**
 * @file   io_error.h
 * @brief  Contains `IoError`, the error reported by writers and handles,
 *         and its translation to/from boundary status codes.
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_VOCABULARY_IO_ERROR
#define __HG_THINIO_VOCABULARY_IO_ERROR

#include <cerrno>
#include <cstdint>
#include <limits>
#include <optional>
#include <thinio_contracts/contracts.h>

namespace thinio
{
  /// @brief The kind of an IoError
  enum class IoErrorKind : uint8_t
  {
    /// @brief A platform error, `raw_os_error()` holds its code
    Os,
    /// @brief The operation terminated abnormally and poisoned the handle
    Poisoned,
    /// @brief The handle was poisoned by an earlier operation
    AlreadyPoisoned,
    /// @brief The arguments of the operation were invalid
    Malformed,
    /// @brief Any other error
    Other,
  };

  /// @brief Status returned across the boundary for `IoErrorKind::Poisoned`
  inline constexpr int64_t STATUS_POISONED = -65536;
  /// @brief Status returned across the boundary for `IoErrorKind::AlreadyPoisoned`
  inline constexpr int64_t STATUS_ALREADY_POISONED = -65537;
  /// @brief Status returned across the boundary for `IoErrorKind::Malformed`
  inline constexpr int64_t STATUS_MALFORMED = -65538;
  /// @brief Status returned across the boundary for `IoErrorKind::Other`
  inline constexpr int64_t STATUS_OTHER = -65539;

  /// @brief An I/O error: a platform error code or one of the handle
  /// specific failures.
  class IoError
  {
    /// @brief The platform error code (only meaningful for `Os`)
    int32_t _code;
    /// @brief The kind of the error
    IoErrorKind _kind;

    constexpr IoError(IoErrorKind kind, int32_t code) noexcept
        : _code(code)
        , _kind(kind)
    {
    }

  public:
    /// @brief Creates an error from a platform error code
    /// @param code The code (as found in `errno`), must be positive
    static constexpr IoError from_raw_os_error(int32_t code) noexcept
    {
      THINIO_pre(code > 0, "platform error codes are positive");
      return IoError{IoErrorKind::Os, code};
    }
    /// @brief Creates an error from the current value of `errno`.
    /// If `errno` is not set, the error is of kind `Other`.
    static IoError last_os_error() noexcept
    {
      const int code = errno;
      if (code > 0)
        return IoError{IoErrorKind::Os, static_cast<int32_t>(code)};
      return other();
    }
    static constexpr IoError poisoned() noexcept
    {
      return IoError{IoErrorKind::Poisoned, 0};
    }
    static constexpr IoError already_poisoned() noexcept
    {
      return IoError{IoErrorKind::AlreadyPoisoned, 0};
    }
    static constexpr IoError malformed() noexcept
    {
      return IoError{IoErrorKind::Malformed, 0};
    }
    static constexpr IoError other() noexcept { return IoError{IoErrorKind::Other, 0}; }

    constexpr IoErrorKind kind() const noexcept { return _kind; }

    /// @brief Returns the platform error code, if any
    constexpr std::optional<int32_t> raw_os_error() const noexcept
    {
      if (_kind == IoErrorKind::Os)
        return _code;
      return std::nullopt;
    }

    /// @brief True for both `Poisoned` and `AlreadyPoisoned`
    constexpr bool is_poison() const noexcept
    {
      return _kind == IoErrorKind::Poisoned || _kind == IoErrorKind::AlreadyPoisoned;
    }

    /// @brief Converts the error to a (negative) boundary status code.
    /// Platform errors become `-code`, other kinds their reserved sentinel.
    constexpr int64_t to_status() const noexcept
    {
      switch (_kind)
      {
      case IoErrorKind::Os:
        return -static_cast<int64_t>(_code);
      case IoErrorKind::Poisoned:
        return STATUS_POISONED;
      case IoErrorKind::AlreadyPoisoned:
        return STATUS_ALREADY_POISONED;
      case IoErrorKind::Malformed:
        return STATUS_MALFORMED;
      default:
        return STATUS_OTHER;
      }
    }

    /// @brief Converts a negative boundary status code back to an error.
    /// @param status The status (< 0)
    static constexpr IoError from_status(int64_t status) noexcept
    {
      THINIO_pre(status < 0, "only negative statuses are errors");
      switch (status)
      {
      case STATUS_POISONED:
        return poisoned();
      case STATUS_ALREADY_POISONED:
        return already_poisoned();
      case STATUS_MALFORMED:
        return malformed();
      case STATUS_OTHER:
        return other();
      default:
        break;
      }
      if (status >= -static_cast<int64_t>(std::numeric_limits<int32_t>::max()))
        return IoError{IoErrorKind::Os, static_cast<int32_t>(-status)};
      return other();
    }

    constexpr bool operator==(const IoError&) const noexcept = default;
  };
} // namespace thinio

#endif // !__HG_THINIO_VOCABULARY_IO_ERROR
