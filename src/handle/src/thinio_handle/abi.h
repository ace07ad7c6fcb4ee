/*****************************************************************/ /**
 * @file   abi.h
 * @brief  Contains the C-compatible declarations shared by both sides
 *         of the boundary: the opaque handle, the builder result,
 *         the foreign callback types and the status codes.
 *
 * This header is valid C11 and C++20.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_ABI
#define __HG_THINIO_HANDLE_ABI

#include <stddef.h>
#include <stdint.h>

#include <thinio_handle_export.h>

#ifdef __cplusplus
  /// @brief Marks a function as not throwing (C++ only)
  #define THINIO_NOEXCEPT noexcept
extern "C" {
#else
  /// @brief Marks a function as not throwing (C++ only)
  #define THINIO_NOEXCEPT
#endif // __cplusplus

/// @brief Opaque handle over an owned writable stream.
/// Only ever manipulated through a pointer, and destroyed exactly once
/// through `thinio_file_handle_destroy`.
typedef struct thinio_file_handle thinio_file_handle;

/// @brief Destroys the object constructed at `place` (must not fail)
typedef void (*thinio_foreign_destroy_fn)(void* place);
/// @brief Writes `len` bytes to the object at `place`.
/// Returns the number of bytes written, or a negative status code.
typedef int64_t (*thinio_foreign_write_fn)(void* place, const char* data, size_t len);
/// @brief Flushes the object at `place`.
/// Returns 0, or a negative status code.
typedef int64_t (*thinio_foreign_flush_fn)(void* place);

/// @brief Result of reserving a handle for an object constructed by the caller
typedef struct thinio_file_handle_builder
{
  /// @brief The handle, NULL on failure
  thinio_file_handle* file_handle;
  /// @brief Where the caller must construct its object, NULL on failure.
  /// The handle must not be used before the object is constructed.
  void* place;
} thinio_file_handle_builder;

/// @brief The operation failed abnormally and poisoned the handle
#define THINIO_STATUS_POISONED ((int64_t)-65536)
/// @brief The handle was poisoned by an earlier operation
#define THINIO_STATUS_ALREADY_POISONED ((int64_t)-65537)
/// @brief The arguments were invalid (NULL handle, NULL data...)
#define THINIO_STATUS_MALFORMED ((int64_t)-65538)
/// @brief Any other failure
#define THINIO_STATUS_OTHER ((int64_t)-65539)

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // !__HG_THINIO_HANDLE_ABI
