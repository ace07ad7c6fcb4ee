/*****************************************************************/ /**
 * @file   external.cpp
 * @brief  Contains the implementation of `external.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <thinio_handle/external.h>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <exception>

namespace thinio
{
  namespace
  {
    /// @brief The header of a handle built for a foreign object.
    /// The object starts `object_offset` bytes after the handle.
    struct ExternalFileHandle
    {
      FileHandle base;
      std::size_t object_offset;
      ForeignCallbacks callbacks;
    };
    static_assert(std::is_standard_layout_v<ExternalFileHandle>);
    static_assert(offsetof(ExternalFileHandle, base) == 0);

    /// @brief Tag whose token identifies external handles
    struct ExternalPayload
    {
    };

    ExternalFileHandle* as_external(FileHandle* handle) noexcept
    {
      return reinterpret_cast<ExternalFileHandle*>(handle);
    }

    void* place_of(ExternalFileHandle* external) noexcept
    {
      THINIO_debug_assert(
          external->object_offset >= sizeof(ExternalFileHandle)
              && external->object_offset <= external->base.layout.size(),
          "foreign object outside of its representation");
      return reinterpret_cast<std::byte*>(external) + external->object_offset;
    }

    void destroy_external(FileHandle* handle) noexcept
    {
      THINIO_TRACE_FN();
      auto* external = as_external(handle);
      if (!is_poisoned(handle))
      {
        try
        {
          THINIO_TRACE_BLOCK("foreign destroy");
          external->callbacks.destroy(place_of(external));
        }
        catch (const std::exception& e)
        {
          report_poison(handle, "destroy", e.what());
        }
        catch (...)
        {
          report_poison(handle, "destroy", "unknown exception");
        }
      }
      detail::release_representation(handle);
    }

    WriteResult write_external(FileHandle* handle, std::span<const std::byte> data) noexcept
    {
      THINIO_TRACE_FN();
      auto* external = as_external(handle);
      return detail::guarded_call(
          handle, "write",
          [&]() -> WriteResult
          {
            const auto status = external->callbacks.write(
                place_of(external), reinterpret_cast<const char*>(data.data()),
                data.size());
            if (status < 0)
              return {unexpected, IoError::from_status(status)};
            return static_cast<std::size_t>(status);
          });
    }

    FlushResult flush_external(FileHandle* handle) noexcept
    {
      THINIO_TRACE_FN();
      auto* external = as_external(handle);
      return detail::guarded_call(
          handle, "flush",
          [&]() -> FlushResult
          {
            const auto status = external->callbacks.flush(place_of(external));
            if (status < 0)
              return {unexpected, IoError::from_status(status)};
            return {};
          });
    }
  } // namespace

  Expected<FileHandleBuilder, IoError> new_file_handle_builder(
      alloc::Layout object, const ForeignCallbacks& callbacks) noexcept
  {
    THINIO_TRACE_FN();
    if (callbacks.destroy == nullptr || callbacks.write == nullptr
        || callbacks.flush == nullptr)
      return {unexpected, IoError::malformed()};

    const auto extended = alloc::Layout::of<ExternalFileHandle>().extend(object);
    if (!extended.has_value())
      return {unexpected, IoError::malformed()};
    const auto layout = extended->layout.pad_to_align();

    const auto blk = alloc::MallocatorAligned{}.allocate(layout);
    if (blk == alloc::nullblock)
      return {unexpected, IoError::from_raw_os_error(ENOMEM)};
    std::memset(blk.ptr(), 0, layout.size());

    auto* external = std::construct_at(
        static_cast<ExternalFileHandle*>(blk.ptr()),
        ExternalFileHandle{
            FileHandle{
                layout, type_token_of<ExternalPayload>(), false, &destroy_external,
                &write_external, &flush_external},
            extended->offset, callbacks});
    return FileHandleBuilder{&external->base, place_of(external)};
  }

  bool is_external(const FileHandle* handle) noexcept
  {
    return is<ExternalPayload>(handle);
  }
} // namespace thinio
