/*****************************************************************/ /**
 * @file   tracing.h
 * @brief  Contains tracing macros.
 * When `THINIO_ENABLE_TRACING` is defined, the macros open Tracy zones.
 * Otherwise they expand to nothing.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_TRACING_TRACING
#define __HG_THINIO_TRACING_TRACING

#ifdef THINIO_ENABLE_TRACING
  #include <tracy/Tracy.hpp>

  /// @brief Traces the current function
  #define THINIO_TRACE_FN() ZoneScoped
  /// @brief Traces a block (which is named), at most one per scope
  /// @code{.cpp}
  /// {
  ///   THINIO_TRACE_BLOCK("foreign destroy");
  ///   callbacks.destroy(place);
  /// }
  /// @endcode
  #define THINIO_TRACE_BLOCK(name) ZoneNamedN(__thinio_block_zone, name, true)
  /// @brief Adds a message to the current zone
  #define THINIO_TRACE_MESSAGE(text) TracyMessageL(text)

#else

  /// @brief Traces the current function
  #define THINIO_TRACE_FN() \
    do                      \
    {                       \
    } while (0)
  /// @brief Traces a block (which is named)
  #define THINIO_TRACE_BLOCK(name) (void)0
  /// @brief Adds a message to the current zone
  #define THINIO_TRACE_MESSAGE(text) (void)0
#endif // THINIO_ENABLE_TRACING

#endif // !__HG_THINIO_TRACING_TRACING
