/*****************************************************************/ /**
 * @file   poison.cpp
 * @brief  Contains the implementation of `poison.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <thinio_handle/poison.h>
#include <thinio_handle/file_handle.h>
#include <atomic>
#include <cstdio>

namespace thinio
{
  /// @brief Function to call on poisoning, must not be null.
  static std::atomic<on_poison_fn_t> POISON_HOOK = &default_on_poison;

  on_poison_fn_t register_on_poison(on_poison_fn_t fn) noexcept
  {
    THINIO_pre(fn != nullptr, "expected non-null hook");
    return POISON_HOOK.exchange(fn, std::memory_order_acq_rel);
  }

  void default_on_poison(
      const FileHandle* handle, const char* operation, const char* what) noexcept
  {
    std::fprintf(
        stderr,
        "WARNING: file handle %p poisoned during `%s`: %s\n"
        "         its payload will not be used nor destroyed.\n",
        static_cast<const void*>(handle), operation, what);
  }

  void report_poison(
      const FileHandle* handle, const char* operation, const char* what) noexcept
  {
    if (auto fn = POISON_HOOK.load(std::memory_order_acquire))
      fn(handle, operation, what);
  }

  void mark_poisoned(FileHandle* handle, const char* operation, const char* what) noexcept
  {
    THINIO_pre(handle != nullptr, "expected a non-null handle");
    THINIO_TRACE_MESSAGE("file handle poisoned");
    std::atomic_ref<bool>(handle->poisoned).store(true, std::memory_order_release);
    report_poison(handle, operation, what);
  }

  bool is_poisoned(const FileHandle* handle) noexcept
  {
    THINIO_pre(handle != nullptr, "expected a non-null handle");
    // atomic_ref<const T> is not available before C++26. Handles created
    // by `for_writer` or the builder live in heap memory and are never const
    // objects; the `DISPATCH_TABLE_FOR<W>` prototypes are, hence the
    // precondition of `is_poisoned` that excludes them.
    return std::atomic_ref<bool>(const_cast<bool&>(handle->poisoned))
        .load(std::memory_order_acquire);
  }
} // namespace thinio
