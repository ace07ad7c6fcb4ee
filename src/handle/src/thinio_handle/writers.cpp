/*****************************************************************/ /**
 * @file   writers.cpp
 * @brief  Contains the implementation of `writers.h`.
 *
 * @date   October 2026
 *********************************************************************/
#include <thinio_handle/writers.h>
#include <thinio_tracing/tracing.h>
#include <cerrno>
#include <utility>

namespace thinio
{
  /// @brief Writes `data` to `file`
  static WriteResult write_to(std::FILE* file, std::span<const std::byte> data) noexcept
  {
    if (data.empty())
      return std::size_t{0};
    errno              = 0;
    const auto written = std::fwrite(data.data(), 1, data.size(), file);
    if (written == 0)
      return {unexpected, IoError::last_os_error()};
    return written;
  }

  /// @brief Flushes `file`
  static FlushResult flush_to(std::FILE* file) noexcept
  {
    errno = 0;
    if (std::fflush(file) != 0)
      return {unexpected, IoError::last_os_error()};
    return {};
  }

  WriteResult StdoutWriter::write(std::span<const std::byte> data) noexcept
  {
    return write_to(stdout, data);
  }

  FlushResult StdoutWriter::flush() noexcept
  {
    return flush_to(stdout);
  }

  Expected<FileWriter, IoError> FileWriter::create(const char* path) noexcept
  {
    THINIO_TRACE_FN();
    THINIO_pre(path != nullptr, "expected a non-null path");
    errno = 0;
    if (std::FILE* file = std::fopen(path, "wb"))
      return FileWriter{file};
    return {unexpected, IoError::last_os_error()};
  }

  FileWriter::FileWriter(FileWriter&& other) noexcept
      : _file(std::exchange(other._file, nullptr))
  {
  }

  FileWriter& FileWriter::operator=(FileWriter&& other) noexcept
  {
    if (this != &other)
    {
      if (_file != nullptr)
        std::fclose(_file);
      _file = std::exchange(other._file, nullptr);
    }
    return *this;
  }

  FileWriter::~FileWriter()
  {
    if (_file != nullptr)
      std::fclose(_file);
  }

  WriteResult FileWriter::write(std::span<const std::byte> data) noexcept
  {
    THINIO_TRACE_FN();
    THINIO_pre(_file != nullptr, "use of a moved-from FileWriter");
    return write_to(_file, data);
  }

  FlushResult FileWriter::flush() noexcept
  {
    THINIO_TRACE_FN();
    THINIO_pre(_file != nullptr, "use of a moved-from FileWriter");
    return flush_to(_file);
  }
} // namespace thinio
