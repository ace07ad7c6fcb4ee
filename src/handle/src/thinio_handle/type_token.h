/*****************************************************************/ /**
 * @file   type_token.h
 * @brief  Contains `TypeToken`, a per-type identity used by downcasts.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_TYPE_TOKEN
#define __HG_THINIO_HANDLE_TYPE_TOKEN

#include <type_traits>

namespace thinio
{
  /// @brief Identity of a type, unique within one program build.
  /// Only meant for same-process checks: it is neither stable across
  /// builds nor meaningful in another process.
  using TypeToken = const void*;

  namespace detail
  {
    /// @brief One anchor per type, its address is the token.
    /// Not const so that the linker cannot fold anchors together.
    template<typename T>
    struct type_token_anchor
    {
      static inline char value = 0;
    };
  } // namespace detail

  /// @brief Returns the token of `T` (cv-qualifiers ignored)
  template<typename T>
  constexpr TypeToken type_token_of() noexcept
  {
    return &detail::type_token_anchor<std::remove_cv_t<T>>::value;
  }
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_TYPE_TOKEN
