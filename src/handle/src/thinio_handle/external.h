/*****************************************************************/ /**
 * @file   external.h
 * @brief  Contains the external construction path: a handle whose
 *         payload is constructed and operated by foreign code.
 *
 * Construction happens in two phases:
 * - `new_file_handle_builder` reserves a representation sized and
 *   aligned for the foreign object, and returns the handle together
 *   with the (zeroed) place where the object must be constructed;
 * - the caller constructs its object at that place, with its own means.
 * The handle must not be written to, flushed or destroyed before the
 * second phase, which cannot be checked.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_EXTERNAL
#define __HG_THINIO_HANDLE_EXTERNAL

#include <thinio_handle_export.h>
#include <thinio_allocators/allocator.h>
#include <thinio_vocabular/expected.h>
#include <thinio_vocabular/io_error.h>
#include <thinio_handle/abi.h>
#include <thinio_handle/file_handle.h>

namespace thinio
{
  /// @brief The callbacks operating on a foreign object
  struct ForeignCallbacks
  {
    /// @brief Destroys the object
    thinio_foreign_destroy_fn destroy;
    /// @brief Writes to the object
    thinio_foreign_write_fn write;
    /// @brief Flushes the object
    thinio_foreign_flush_fn flush;
  };

  /// @brief A reserved handle and the place of its foreign object
  using FileHandleBuilder = thinio_file_handle_builder;

  /// @brief Reserves a handle for a foreign object.
  /// Each callback receives the returned `place`. Negative values
  /// returned by the write/flush callbacks are status codes, translated
  /// through `IoError::from_status`.
  /// @param object The layout of the foreign object
  /// @param callbacks The callbacks (none may be null)
  /// @return The builder, `IoErrorKind::Malformed` for null callbacks or
  /// an overflowing layout, `ENOMEM` if the allocation failed
  THINIO_HANDLE_EXPORT
  Expected<FileHandleBuilder, IoError> new_file_handle_builder(
      alloc::Layout object, const ForeignCallbacks& callbacks) noexcept;

  /// @brief Check if a handle was built by `new_file_handle_builder`
  /// @param handle The handle (not null)
  THINIO_HANDLE_EXPORT
  bool is_external(const FileHandle* handle) noexcept;
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_EXTERNAL
