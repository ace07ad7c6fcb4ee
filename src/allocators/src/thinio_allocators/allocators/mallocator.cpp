/*****************************************************************/ /**
 * @file   mallocator.cpp
 * @brief  Contains the implementation of `mallocator.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <thinio_allocators/allocators/mallocator.h>
#include <cstddef>
#include <cstdlib>

#if defined(_WIN32)
  #include <malloc.h> // _aligned_malloc, _aligned_free
#else
  #include <stdlib.h> // posix_memalign, free
#endif

namespace thinio::alloc
{
  static void* aligned_malloc(size_t size, size_t alignment) noexcept
  {
    // posix_memalign requires a multiple of sizeof(void*)
    if (alignment < PREFERRED_ALIGNMENT)
      alignment = PREFERRED_ALIGNMENT;
    if (size == 0)
      size = 1;

#if defined(_WIN32)
    return _aligned_malloc(size, alignment);
#else
    void* p = nullptr;
    if (posix_memalign(&p, alignment, size) != 0)
      return nullptr;
    return p;
#endif
  }

  static void aligned_free(void* ptr) noexcept
  {
    if (ptr == nullptr)
      return;

#if defined(_WIN32)
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
  }

  Block MallocatorAligned::allocate(Layout request) const noexcept
  {
    return {aligned_malloc(request.size(), request.align()), request.size()};
  }

  void MallocatorAligned::deallocate(Block blk) const noexcept
  {
    aligned_free(blk.ptr());
  }
} // namespace thinio::alloc
