/*****************************************************************/ /**
 * @file   mallocator.h
 * @brief  Contains `MallocatorAligned`.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_ALLOCATORS_MALLOCATOR
#define __HG_THINIO_ALLOCATORS_MALLOCATOR

#include <thinio_allocators_export.h>
#include <thinio_allocators/allocator.h>

namespace thinio::alloc
{
  /// @brief Allocator wrapper over aligned `malloc` and aligned `free`.
  /// This allocator supports extended alignment. If the underlying OS
  /// cannot allocate a block with that specific alignment, `nullblock`
  /// is returned.
  /// Blocks are aligned to at least `PREFERRED_ALIGNMENT`.
  /// This allocator is guaranteed stateless: constructor/destructor
  /// are not required to be called, and a block may be freed by another
  /// instance (or thread) than the one that allocated it.
  struct MallocatorAligned
  {
    THINIO_ALLOCATORS_EXPORT
    /// @brief Allocates a block aligned to at least `request.align()`
    /// @param request The allocation request
    /// @return The block or nullblock on failure
    Block allocate(Layout request) const noexcept;

    THINIO_ALLOCATORS_EXPORT
    /// @brief Deallocates a block (nullblock is ignored)
    /// @param blk The block to deallocate
    void deallocate(Block blk) const noexcept;
  };
} // namespace thinio::alloc

#endif // !__HG_THINIO_ALLOCATORS_MALLOCATOR
