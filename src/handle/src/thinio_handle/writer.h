/*****************************************************************/ /**
 * @file   writer.h
 * @brief  Contains the `IsWriter` concept, the capability every payload
 *         of a handle must provide.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_WRITER
#define __HG_THINIO_HANDLE_WRITER

#include <concepts>
#include <cstddef>
#include <span>
#include <type_traits>

#include <thinio_vocabular/expected.h>
#include <thinio_vocabular/io_error.h>

namespace thinio
{
  /// @brief Result of a write: the number of bytes accepted, or an error
  using WriteResult = Expected<std::size_t, IoError>;
  /// @brief Result of a flush
  using FlushResult = Expected<void, IoError>;

  /// @brief A writable stream that can be owned by a handle.
  /// The handle may be moved to (and destroyed on) another thread than
  /// the one that created it: writers must not rely on thread affinity.
  /// @code{.cpp}
  /// struct Counter
  /// {
  ///   std::size_t total = 0;
  ///
  ///   WriteResult write(std::span<const std::byte> data)
  ///   {
  ///     total += data.size();
  ///     return data.size();
  ///   }
  ///   FlushResult flush() { return {}; }
  /// };
  /// static_assert(IsWriter<Counter>);
  /// @endcode
  template<typename W>
  concept IsWriter = std::is_object_v<W> && !std::is_const_v<W>
                     && std::move_constructible<W>
                     && std::is_nothrow_destructible_v<W>
                     && requires(W& writer, std::span<const std::byte> data) {
                          { writer.write(data) } -> std::same_as<WriteResult>;
                          { writer.flush() } -> std::same_as<FlushResult>;
                        };
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_WRITER
