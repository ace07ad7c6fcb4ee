/*****************************************************************/ /**
 * @file   ffi.h
 * @brief  Contains the C interface of the library.
 *
 * Every function is safe to call from C. Results are status codes:
 * non-negative values are successes (the number of bytes for writes),
 * negative values are either `-errno` or one of the `THINIO_STATUS_*`
 * sentinels, which never collide with platform error codes.
 *
 * @code{.c}
 * thinio_file_handle* out = thinio_new_file_handle_from_path("out.txt");
 * if (out == NULL)
 *   return -1;
 * int64_t written = thinio_file_handle_write(out, "hello", 5);
 * thinio_file_handle_flush(out);
 * thinio_file_handle_destroy(out);
 * @endcode
 *
 * This header is valid C11 and C++20.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_FFI
#define __HG_THINIO_HANDLE_FFI

#include <thinio_handle/abi.h>

#ifdef __cplusplus
extern "C" {
#endif // __cplusplus

/// @brief Creates a handle that discards everything written to it
/// @return The handle, or NULL if the allocation failed
THINIO_HANDLE_EXPORT
thinio_file_handle* thinio_new_null_file_handle(void) THINIO_NOEXCEPT;

/// @brief Creates a handle writing to the standard output
/// @return The handle, or NULL if the allocation failed
THINIO_HANDLE_EXPORT
thinio_file_handle* thinio_new_stdout_file_handle(void) THINIO_NOEXCEPT;

/// @brief Creates (or truncates) a file and returns a handle writing to it
/// @param path The path of the file
/// @return The handle, or NULL on failure (`errno` describes the failure)
THINIO_HANDLE_EXPORT
thinio_file_handle* thinio_new_file_handle_from_path(const char* path) THINIO_NOEXCEPT;

/// @brief Reserves a handle for an object the caller constructs itself.
/// The caller must construct its object at `place` before using the handle.
/// @param size The size of the object
/// @param alignment The alignment of the object (a power of two)
/// @param destroy Called with `place` on destruction
/// @param write Called with `place` on writes
/// @param flush Called with `place` on flushes
/// @return The handle and place, both NULL on failure
THINIO_HANDLE_EXPORT
thinio_file_handle_builder thinio_new_file_handle_builder(
    size_t size, size_t alignment, thinio_foreign_destroy_fn destroy,
    thinio_foreign_write_fn write, thinio_foreign_flush_fn flush) THINIO_NOEXCEPT;

/// @brief Destroys a handle (NULL is a no-op).
/// The handle must not be used after this call.
THINIO_HANDLE_EXPORT
void thinio_file_handle_destroy(thinio_file_handle* handle) THINIO_NOEXCEPT;

/// @brief Writes `len` bytes to a handle
/// @return The number of bytes written, or a negative status
THINIO_HANDLE_EXPORT
int64_t thinio_file_handle_write(
    thinio_file_handle* handle, const char* data, size_t len) THINIO_NOEXCEPT;

/// @brief Flushes a handle
/// @return 0, or a negative status
THINIO_HANDLE_EXPORT
int64_t thinio_file_handle_flush(thinio_file_handle* handle) THINIO_NOEXCEPT;

/// @brief Check if a handle is poisoned
/// @return 1 if poisoned, 0 otherwise (and for NULL)
THINIO_HANDLE_EXPORT
int thinio_file_handle_is_poisoned(const thinio_file_handle* handle) THINIO_NOEXCEPT;

#ifdef __cplusplus
}
#endif // __cplusplus

#endif // !__HG_THINIO_HANDLE_FFI
