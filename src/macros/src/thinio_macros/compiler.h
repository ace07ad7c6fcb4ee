/*****************************************************************/ /**
 * @file   compiler.h
 * @brief  Contains macros to abstract compiler differences.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_MACROS_COMPILER
#define __HG_THINIO_MACROS_COMPILER

#if defined(_MSC_VER)
  #define THINIO_MSVC 1
#else
  #define THINIO_MSVC 0
#endif

#if defined(__clang__)
  #define THINIO_CLANG 1
#else
  #define THINIO_CLANG 0
#endif

#if defined(__GNUC__) && !THINIO_CLANG
  #define THINIO_GCC 1
#else
  #define THINIO_GCC 0
#endif

#if THINIO_MSVC
  /// @brief Forces no-inlining of a function (used for cold paths)
  #define THINIO_NO_INLINE __declspec(noinline)
#elif THINIO_GCC || THINIO_CLANG
  /// @brief Forces no-inlining of a function (used for cold paths)
  #define THINIO_NO_INLINE __attribute__((noinline))
#else
  /// @brief Forces no-inlining of a function (used for cold paths)
  #define THINIO_NO_INLINE
#endif

#if THINIO_GCC || THINIO_CLANG
  /// @brief Hints that `x` is usually true
  #define THINIO_LIKELY(x) __builtin_expect(!!(x), 1)
  /// @brief Hints that `x` is usually false
  #define THINIO_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
  #define THINIO_LIKELY(x)   (x)
  #define THINIO_UNLIKELY(x) (x)
#endif

#endif // !__HG_THINIO_MACROS_COMPILER
