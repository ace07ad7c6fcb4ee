/*****************************************************************/ /**
 * @file   poison.h
 * @brief  Contains the poison flag accessors and the poison hook.
 *
 * A dispatched operation that exits through an exception poisons its
 * handle: from then on `write` and `flush` fail without reaching the
 * payload, and `destroy` only releases the raw memory.
 * Each poisoning is reported to a replaceable hook, which by default
 * prints a line on `stderr`.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_POISON
#define __HG_THINIO_HANDLE_POISON

#include <thinio_handle_export.h>
#include <thinio_handle/abi.h>
#include <thinio_macros/compiler.h>

namespace thinio
{
  /// @brief The abstract handle
  using FileHandle = ::thinio_file_handle;

  /// @brief The function called when a handle is poisoned.
  /// @param handle The handle that was poisoned
  /// @param operation The operation that failed ("write", "flush"...)
  /// @param what The message of the exception
  using on_poison_fn_t =
      void (*)(const FileHandle* handle, const char* operation, const char* what) noexcept;

  /// @brief Registers the function to call when a handle is poisoned.
  /// @param fn The new hook (must not be null)
  /// @return The previously registered hook
  /// @note This function is thread safe.
  THINIO_HANDLE_EXPORT
  on_poison_fn_t register_on_poison(on_poison_fn_t fn) noexcept;

  THINIO_HANDLE_EXPORT
  /// @brief The default poison hook, prints a warning to `stderr`
  /// @param handle The handle that was poisoned
  /// @param operation The operation that failed
  /// @param what The message of the exception
  void default_on_poison(
      const FileHandle* handle, const char* operation, const char* what) noexcept;

  THINIO_HANDLE_EXPORT
  /// @brief Calls the registered poison hook, without touching the handle
  /// @param handle The handle
  /// @param operation The operation that failed
  /// @param what The message of the exception
  void report_poison(
      const FileHandle* handle, const char* operation, const char* what) noexcept;

  THINIO_HANDLE_EXPORT THINIO_NO_INLINE
  /// @brief Poisons a handle (release store) and reports it
  /// @param handle The handle to poison (not null)
  /// @param operation The operation that failed
  /// @param what The message of the exception
  void mark_poisoned(FileHandle* handle, const char* operation, const char* what) noexcept;

  THINIO_HANDLE_EXPORT
  /// @brief Check if a handle is poisoned (acquire load)
  /// @param handle The handle (not null). It must be the header of a
  /// representation created by `for_writer`, `try_for_writer` or
  /// `new_file_handle_builder`: a `DISPATCH_TABLE_FOR<W>` prototype is a
  /// const object and cannot be read through `std::atomic_ref`.
  /// @return True if poisoned
  bool is_poisoned(const FileHandle* handle) noexcept;
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_POISON
