/*****************************************************************/ /**
 * @file   allocator.cpp
 * @brief  Contains the implementation of `allocator.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include "allocator.h"
#include <atomic>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>

namespace thinio::alloc
{
  /// @brief Function to call on allocation failure, must not be null.
  static std::atomic<alloc_fail_fn_t> ALLOC_FAIL_HOOK = &default_on_alloc_fail;

  alloc_fail_fn_t register_on_alloc_fail(alloc_fail_fn_t fn) noexcept
  {
    THINIO_pre(fn != nullptr, "expected non-null hook");
    return ALLOC_FAIL_HOOK.exchange(fn, std::memory_order_acq_rel);
  }

  void default_on_alloc_fail(Layout request, const std::source_location& loc) noexcept
  {
    std::fprintf(
        stderr,
        "FATAL ERROR: Allocation failure of size %" PRIu64 " (align %" PRIu64 ")\n"
        "             from %s:%" PRIu64 "\n"
        "             in function `%s`.\n",
        (uint64_t)request.size(), (uint64_t)request.align(), loc.file_name(),
        (uint64_t)loc.line(), loc.function_name());
    std::abort();
  }

  void handle_alloc_fail(Layout request, const std::source_location& loc) noexcept
  {
    if (auto fn = ALLOC_FAIL_HOOK.load(std::memory_order_acquire))
      fn(request, loc);
    // the hook is not allowed to resume the failed allocation
    std::abort();
  }
} // namespace thinio::alloc
