/*****************************************************************/ /**
 * @file   allocator.h
 * @brief  Contains `Layout` and the allocation failure utilities.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_ALLOCATORS_ALLOCATOR
#define __HG_THINIO_ALLOCATORS_ALLOCATOR

#include <concepts>
#include <cstddef>
#include <limits>
#include <optional>
#include <source_location>

#include <thinio_allocators_export.h>
#include <thinio_allocators/block.h>
#include <thinio_contracts/contracts.h>

/// @brief Everything related to memory allocation
namespace thinio::alloc
{
  /// @brief The alignment every allocation made through `MallocatorAligned`
  /// is guaranteed to have, even if less is requested.
  inline constexpr std::size_t PREFERRED_ALIGNMENT =
#ifdef __STDCPP_DEFAULT_NEW_ALIGNMENT__
      __STDCPP_DEFAULT_NEW_ALIGNMENT__;
#else
      alignof(std::max_align_t);
#endif

  /// @brief Check if an integer is a (non-zero) power of two
  /// @tparam T The integer type
  /// @param n The integer
  /// @return True if power of two
  template<std::integral T>
  constexpr bool is_power_of_2(T n) noexcept
  {
    return n != 0 && (n & (n - 1)) == 0;
  }

  /// @brief The result of appending a layout to another
  struct ExtendedLayout;

  /// @brief Size and alignment of a memory region.
  /// The alignment is always a power of two.
  class Layout
  {
    std::size_t _size;
    std::size_t _align;

  public:
    /// @brief Constructs a layout
    /// @param size The size in bytes
    /// @param align The alignment (a power of two)
    constexpr Layout(std::size_t size, std::size_t align) noexcept
        : _size(size)
        , _align(align)
    {
      THINIO_pre(is_power_of_2(align), "alignment must be a power of two");
    }

    constexpr Layout(Layout&&) noexcept                 = default;
    constexpr Layout(const Layout&) noexcept            = default;
    constexpr Layout& operator=(Layout&&) noexcept      = default;
    constexpr Layout& operator=(const Layout&) noexcept = default;

    /// @brief Returns the layout of `T`
    template<typename T>
    static constexpr Layout of() noexcept
    {
      return Layout{sizeof(T), alignof(T)};
    }

    /// @brief Validates a size/alignment pair coming from untrusted code.
    /// @param size The size in bytes
    /// @param align The alignment
    /// @return The layout, or nothing if `align` is not a power of two or
    /// `size` rounded up to `align` would overflow.
    static constexpr std::optional<Layout> from_size_align(
        std::size_t size, std::size_t align) noexcept
    {
      if (!is_power_of_2(align))
        return std::nullopt;
      if (size > std::numeric_limits<std::size_t>::max() - (align - 1))
        return std::nullopt;
      return Layout{size, align};
    }

    constexpr std::size_t size() const noexcept { return _size; }
    constexpr std::size_t align() const noexcept { return _align; }

    /// @brief Returns the layout with its size rounded up to its alignment.
    /// @pre The rounded size does not overflow.
    constexpr Layout pad_to_align() const noexcept
    {
      return Layout{(_size + _align - 1) & ~(_align - 1), _align};
    }

    /// @brief Appends `next` after this layout, as a struct would lay out
    /// a member of layout `next` after members described by `*this`.
    /// @param next The layout to append
    /// @return The combined layout (not padded to its alignment) and the
    /// offset of `next` within it, or nothing on overflow.
    constexpr std::optional<ExtendedLayout> extend(Layout next) const noexcept;

    constexpr bool operator==(const Layout&) const noexcept = default;
  };

  struct ExtendedLayout
  {
    /// @brief The combined layout
    Layout layout;
    /// @brief The offset of the appended layout
    std::size_t offset;
  };

  constexpr std::optional<ExtendedLayout> Layout::extend(Layout next) const noexcept
  {
    constexpr auto MAX = std::numeric_limits<std::size_t>::max();
    const std::size_t new_align = _align > next._align ? _align : next._align;
    if (_size > MAX - (next._align - 1))
      return std::nullopt;
    const std::size_t offset = (_size + next._align - 1) & ~(next._align - 1);
    if (offset > MAX - next._size)
      return std::nullopt;
    const std::size_t new_size = offset + next._size;
    if (new_size > MAX - (new_align - 1))
      return std::nullopt;
    return ExtendedLayout{Layout{new_size, new_align}, offset};
  }

  /// @brief The function to call on allocation failure.
  /// The function receives the attempted allocation, and
  /// the source location of the allocation.
  using alloc_fail_fn_t = void (*)(Layout, const std::source_location&) noexcept;

  /// @brief Register a function to call on infallible allocation failure.
  /// @param fn The function to call on infallible allocation failure.
  /// @return The old registered function
  /// @note This function is thread safe.
  /// @pre `fn` must not be nullptr
  THINIO_ALLOCATORS_EXPORT
  alloc_fail_fn_t register_on_alloc_fail(alloc_fail_fn_t fn) noexcept;

  [[noreturn]]
  THINIO_ALLOCATORS_EXPORT
      /// @brief The default function that is called on allocation failure
      /// @param request The allocation that failed
      /// @param loc The source location of the allocation
      void default_on_alloc_fail(
          Layout request, const std::source_location& loc) noexcept;

  [[noreturn]]
  THINIO_ALLOCATORS_EXPORT
      /// @brief Function that MUST be called when an infallible allocation fails.
      /// @note Callers should avoid holding any locks.
      /// @param request The allocation that failed
      /// @param loc The source location
      void handle_alloc_fail(
          Layout request, const std::source_location& loc =
                              THINIO_CURRENT_SOURCE_LOCATION) noexcept;
} // namespace thinio::alloc

#endif // !__HG_THINIO_ALLOCATORS_ALLOCATOR
