/*****************************************************************/ /**
 * @file   file_handle.h
 * @brief  Contains the handle, its per-type dispatch table and the
 *         internal construction path.
 *
 * A handle is never allocated alone: it is the first member of a
 * representation that also holds the payload. For a writer `W`
 * constructed internally the representation is:
 * @code
 * +------------------------+---------+--------------+---------+
 * | FileHandle (header)    | padding | W (payload)  | padding |
 * +------------------------+---------+--------------+---------+
 * ^ handle pointer == allocation pointer
 *                                    ^ Repr<W>::WRITER_OFFSET
 * @endcode
 * The header stores everything needed to release the allocation
 * without knowing `W`, which is what makes a poisoned handle safe to
 * destroy.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_FILE_HANDLE
#define __HG_THINIO_HANDLE_FILE_HANDLE

#include <atomic>
#include <exception>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

#include <thinio_allocators/allocators/mallocator.h>
#include <thinio_contracts/contracts.h>
#include <thinio_macros/compiler.h>
#include <thinio_tracing/tracing.h>
#include <thinio_handle/abi.h>
#include <thinio_handle/poison.h>
#include <thinio_handle/type_token.h>
#include <thinio_handle/writer.h>

namespace thinio
{
  /// @brief Destroys the representation of a handle
  using destroy_fn_t = void (*)(FileHandle*) noexcept;
  /// @brief Writes bytes to the payload of a handle
  using write_fn_t = WriteResult (*)(FileHandle*, std::span<const std::byte>) noexcept;
  /// @brief Flushes the payload of a handle
  using flush_fn_t = FlushResult (*)(FileHandle*) noexcept;
} // namespace thinio

/// @brief The handle: the dispatch table of its representation.
/// The three functions must only be called with the handle they were
/// copied into.
struct thinio_file_handle
{
  /// @brief Size and alignment of the whole representation
  thinio::alloc::Layout layout;
  /// @brief Identity of the payload type
  thinio::TypeToken type_token;
  /// @brief True once an operation exited through an exception.
  /// Only accessed through `std::atomic_ref`.
  bool poisoned;
  /// @brief Releases the representation (payload included)
  thinio::destroy_fn_t destroy;
  /// @brief Writes to the payload
  thinio::write_fn_t write;
  /// @brief Flushes the payload
  thinio::flush_fn_t flush;
};

namespace thinio
{
  static_assert(
      std::atomic_ref<bool>::required_alignment == alignof(bool),
      "the poison flag is accessed through atomic_ref");
  static_assert(std::is_standard_layout_v<FileHandle>);
  static_assert(std::is_trivially_destructible_v<FileHandle>);

  namespace detail
  {
    /// @brief Describes the representation of a handle owning a `W`
    /// @tparam W The writer type
    template<IsWriter W>
    struct Repr
    {
      /// @brief The header layout extended by the payload layout
      static constexpr alloc::ExtendedLayout EXTENDED =
          *alloc::Layout::of<FileHandle>().extend(alloc::Layout::of<W>());
      /// @brief The layout of the whole representation
      static constexpr alloc::Layout LAYOUT = EXTENDED.layout.pad_to_align();
      /// @brief The offset of the payload from the handle
      static constexpr std::size_t WRITER_OFFSET = EXTENDED.offset;

      static W* writer_of(FileHandle* handle) noexcept
      {
        THINIO_debug_pre(
            handle->type_token == type_token_of<W>(),
            "handle dispatched to the wrong representation");
        return std::launder(reinterpret_cast<W*>(
            reinterpret_cast<std::byte*>(handle) + WRITER_OFFSET));
      }
      static const W* writer_of(const FileHandle* handle) noexcept
      {
        THINIO_debug_pre(
            handle->type_token == type_token_of<W>(),
            "handle dispatched to the wrong representation");
        return std::launder(reinterpret_cast<const W*>(
            reinterpret_cast<const std::byte*>(handle) + WRITER_OFFSET));
      }
    };

    /// @brief Releases the memory of a representation, without running
    /// any destructor.
    /// @param handle The handle (not null)
    inline void release_representation(FileHandle* handle) noexcept
    {
      const auto size = handle->layout.size();
      std::destroy_at(handle);
      alloc::MallocatorAligned{}.deallocate(alloc::Block{handle, size});
    }

    /// @brief Runs `fn` unless the handle is poisoned, poisoning it if
    /// `fn` exits through an exception.
    /// @param handle The handle (not null)
    /// @param operation The name of the operation, for the poison hook
    /// @param fn The operation, returns an `Expected<T, IoError>`
    /// @return The result of `fn`, or a poison error
    template<typename Fn>
    auto guarded_call(FileHandle* handle, const char* operation, Fn&& fn) noexcept
        -> std::invoke_result_t<Fn>
    {
      using result_t = std::invoke_result_t<Fn>;

      if (THINIO_UNLIKELY(is_poisoned(handle)))
        return result_t{unexpected, IoError::already_poisoned()};
      try
      {
        return std::forward<Fn>(fn)();
      }
      catch (const std::exception& e)
      {
        mark_poisoned(handle, operation, e.what());
      }
      catch (...)
      {
        mark_poisoned(handle, operation, "unknown exception");
      }
      return result_t{unexpected, IoError::poisoned()};
    }

    template<IsWriter W>
    void destroy_writer(FileHandle* handle) noexcept
    {
      THINIO_TRACE_FN();
      // the payload state is unknown: leak its resources
      if (THINIO_LIKELY(!is_poisoned(handle)))
        std::destroy_at(Repr<W>::writer_of(handle));
      release_representation(handle);
    }

    template<IsWriter W>
    WriteResult write_writer(FileHandle* handle, std::span<const std::byte> data) noexcept
    {
      THINIO_TRACE_FN();
      return guarded_call(
          handle, "write",
          [&]() -> WriteResult { return Repr<W>::writer_of(handle)->write(data); });
    }

    template<IsWriter W>
    FlushResult flush_writer(FileHandle* handle) noexcept
    {
      THINIO_TRACE_FN();
      return guarded_call(
          handle, "flush",
          [&]() -> FlushResult { return Repr<W>::writer_of(handle)->flush(); });
    }
  } // namespace detail

  /// @brief The dispatch table of `W`, copied into every handle owning a `W`.
  /// All handles of the same writer type share the same functions.
  /// This prototype is not a handle: never pass its address to the
  /// handle functions.
  template<IsWriter W>
  inline constexpr FileHandle DISPATCH_TABLE_FOR = {
      detail::Repr<W>::LAYOUT,    type_token_of<W>(),         false,
      &detail::destroy_writer<W>, &detail::write_writer<W>, &detail::flush_writer<W>,
  };

  /// @brief Creates a handle owning `writer`.
  /// If the constructor of the writer throws, the memory is released
  /// and the exception is rethrown.
  /// @param writer The writer to move (or copy) into the handle
  /// @return The handle, or nullptr if the allocation failed
  template<typename W>
    requires IsWriter<std::remove_cvref_t<W>>
             && std::constructible_from<std::remove_cvref_t<W>, W&&>
  FileHandle* try_for_writer(W&& writer)
  {
    using writer_t = std::remove_cvref_t<W>;
    using repr_t   = detail::Repr<writer_t>;
    THINIO_TRACE_FN();

    const alloc::MallocatorAligned allocator{};
    const auto blk = allocator.allocate(repr_t::LAYOUT);
    if (blk == alloc::nullblock)
      return nullptr;

    auto* bytes = static_cast<std::byte*>(blk.ptr());
    try
    {
      std::construct_at(
          reinterpret_cast<writer_t*>(bytes + repr_t::WRITER_OFFSET),
          std::forward<W>(writer));
    }
    catch (...)
    {
      allocator.deallocate(blk);
      throw;
    }
    return std::construct_at(
        reinterpret_cast<FileHandle*>(bytes), DISPATCH_TABLE_FOR<writer_t>);
  }

  /// @brief Creates a handle owning `writer`.
  /// Allocation failure calls `alloc::handle_alloc_fail`.
  /// @param writer The writer to move (or copy) into the handle
  /// @return The handle (never null)
  template<typename W>
    requires IsWriter<std::remove_cvref_t<W>>
             && std::constructible_from<std::remove_cvref_t<W>, W&&>
  FileHandle* for_writer(W&& writer)
  {
    if (auto* handle = try_for_writer(std::forward<W>(writer)))
      return handle;
    alloc::handle_alloc_fail(detail::Repr<std::remove_cvref_t<W>>::LAYOUT);
  }

  /// @brief Destroys a handle and its payload (null is a no-op).
  /// Poisoned payloads are not destroyed, only their memory is released.
  /// @param handle The handle, invalid after the call
  inline void destroy(FileHandle* handle) noexcept
  {
    if (handle != nullptr)
      handle->destroy(handle);
  }

  /// @brief Writes bytes to a handle
  /// @param handle The handle (not null)
  /// @param data The bytes to write
  /// @return The number of bytes written or an error
  inline WriteResult write(FileHandle* handle, std::span<const std::byte> data) noexcept
  {
    THINIO_pre(handle != nullptr, "expected a non-null handle");
    return handle->write(handle, data);
  }

  /// @brief Flushes a handle
  /// @param handle The handle (not null)
  /// @return Nothing or an error
  inline FlushResult flush(FileHandle* handle) noexcept
  {
    THINIO_pre(handle != nullptr, "expected a non-null handle");
    return handle->flush(handle);
  }

  /// @brief Check if the payload of a handle is exactly a `T`
  /// @param handle The handle (not null)
  template<typename T>
  bool is(const FileHandle* handle) noexcept
  {
    THINIO_pre(handle != nullptr, "expected a non-null handle");
    return handle->type_token == type_token_of<T>();
  }

  /// @brief Returns the payload of a handle if it is exactly a `T`.
  /// @param handle The handle (not null)
  /// @return The payload, or nullptr if the type does not match or the
  /// handle is poisoned
  template<IsWriter T>
  const T* downcast_ref(const FileHandle* handle) noexcept
  {
    if (!is<T>(handle) || is_poisoned(handle))
      return nullptr;
    return detail::Repr<T>::writer_of(handle);
  }

  /// @brief Returns the payload of a handle if it is exactly a `T`.
  /// @param handle The handle (not null)
  /// @return The payload, or nullptr if the type does not match or the
  /// handle is poisoned
  template<IsWriter T>
  T* downcast_mut(FileHandle* handle) noexcept
  {
    if (!is<T>(handle) || is_poisoned(handle))
      return nullptr;
    return detail::Repr<T>::writer_of(handle);
  }
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_FILE_HANDLE
