/*****************************************************************/ /**
 * @file   ffi.cpp
 * @brief  Contains the implementation of `ffi.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <thinio_handle/ffi.h>
#include <thinio_handle/external.h>
#include <thinio_handle/file_handle.h>
#include <thinio_handle/writers.h>
#include <cerrno>
#include <limits>
#include <span>
#include <utility>

static_assert(THINIO_STATUS_POISONED == thinio::STATUS_POISONED);
static_assert(THINIO_STATUS_ALREADY_POISONED == thinio::STATUS_ALREADY_POISONED);
static_assert(THINIO_STATUS_MALFORMED == thinio::STATUS_MALFORMED);
static_assert(THINIO_STATUS_OTHER == thinio::STATUS_OTHER);

extern "C" {

thinio_file_handle* thinio_new_null_file_handle(void) noexcept
{
  return thinio::try_for_writer(thinio::NullWriter{});
}

thinio_file_handle* thinio_new_stdout_file_handle(void) noexcept
{
  return thinio::try_for_writer(thinio::StdoutWriter{});
}

thinio_file_handle* thinio_new_file_handle_from_path(const char* path) noexcept
{
  if (path == nullptr)
  {
    errno = EINVAL;
    return nullptr;
  }
  auto writer = thinio::FileWriter::create(path);
  if (writer.is_error())
  {
    if (auto code = writer.error().raw_os_error())
      errno = *code;
    return nullptr;
  }
  auto* handle = thinio::try_for_writer(std::move(writer).value());
  if (handle == nullptr)
    errno = ENOMEM;
  return handle;
}

thinio_file_handle_builder thinio_new_file_handle_builder(
    size_t size, size_t alignment, thinio_foreign_destroy_fn destroy,
    thinio_foreign_write_fn write, thinio_foreign_flush_fn flush) noexcept
{
  const auto layout = thinio::alloc::Layout::from_size_align(size, alignment);
  if (!layout.has_value())
    return {nullptr, nullptr};
  auto builder = thinio::new_file_handle_builder(*layout, {destroy, write, flush});
  if (builder.is_error())
    return {nullptr, nullptr};
  return *builder;
}

void thinio_file_handle_destroy(thinio_file_handle* handle) noexcept
{
  thinio::destroy(handle);
}

int64_t thinio_file_handle_write(
    thinio_file_handle* handle, const char* data, size_t len) noexcept
{
  if (THINIO_UNLIKELY(handle == nullptr || (data == nullptr && len != 0)))
    return THINIO_STATUS_MALFORMED;
  // the byte count must fit in the (positive) status
  if (len > static_cast<size_t>(std::numeric_limits<int64_t>::max()))
    len = static_cast<size_t>(std::numeric_limits<int64_t>::max());

  const auto res = thinio::write(
      handle, std::span{reinterpret_cast<const std::byte*>(data), len});
  if (res.is_error())
    return res.error().to_status();
  return static_cast<int64_t>(*res);
}

int64_t thinio_file_handle_flush(thinio_file_handle* handle) noexcept
{
  if (handle == nullptr)
    return THINIO_STATUS_MALFORMED;
  const auto res = thinio::flush(handle);
  if (res.is_error())
    return res.error().to_status();
  return 0;
}

int thinio_file_handle_is_poisoned(const thinio_file_handle* handle) noexcept
{
  if (handle == nullptr)
    return 0;
  return thinio::is_poisoned(handle) ? 1 : 0;
}
}
