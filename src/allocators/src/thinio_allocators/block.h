/*****************************************************************/ /**
 * @file   block.h
 * @brief  Contains `Block`, the allocation unit of all allocators.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_ALLOCATORS_BLOCK
#define __HG_THINIO_ALLOCATORS_BLOCK

#include <cstddef>

namespace thinio::alloc
{
  /// @brief Allocation unit, a pointer and size.
  class Block
  {
    /// @brief The pointer
    void* _ptr = nullptr;
    /// @brief The size of the allocation
    std::size_t _size = 0;

  public:
    /// @brief Constructs an empty block
    constexpr Block() noexcept = default;
    /// @brief Constructs a block
    /// @param ptr The pointer
    /// @param size The size of the allocation (ignored if `ptr` is null)
    constexpr Block(void* ptr, std::size_t size) noexcept
        : _ptr(ptr)
        , _size(ptr != nullptr ? size : 0)
    {
    }

    constexpr void* ptr() const noexcept { return _ptr; }
    constexpr std::size_t size() const noexcept { return _size; }

    constexpr bool operator==(const Block&) const = default;
  };

  /// @brief Null block
  inline constexpr Block nullblock = {};
} // namespace thinio::alloc

#endif // !__HG_THINIO_ALLOCATORS_BLOCK
