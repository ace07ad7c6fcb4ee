/*****************************************************************/ /**
 * @file   writers.h
 * @brief  Contains the writers provided by the library:
 *         `NullWriter`, `StdoutWriter` and `FileWriter`.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_WRITERS
#define __HG_THINIO_HANDLE_WRITERS

#include <cstdio>
#include <span>

#include <thinio_handle_export.h>
#include <thinio_handle/writer.h>

namespace thinio
{
  /// @brief Writer that accepts and discards every byte
  struct NullWriter
  {
    WriteResult write(std::span<const std::byte> data) noexcept { return data.size(); }
    FlushResult flush() noexcept { return {}; }
  };
  static_assert(IsWriter<NullWriter>);

  /// @brief Writer to the standard output of the process
  struct StdoutWriter
  {
    THINIO_HANDLE_EXPORT
    WriteResult write(std::span<const std::byte> data) noexcept;
    THINIO_HANDLE_EXPORT
    FlushResult flush() noexcept;
  };
  static_assert(IsWriter<StdoutWriter>);

  /// @brief Writer to a file on disk, closed on destruction
  class FileWriter
  {
    /// @brief The file, nullptr if moved-from
    std::FILE* _file;

    explicit FileWriter(std::FILE* file) noexcept
        : _file(file)
    {
    }

  public:
    /// @brief Creates (or truncates) the file at `path`
    /// @param path The path of the file
    /// @return The writer, or the platform error
    THINIO_HANDLE_EXPORT
    static Expected<FileWriter, IoError> create(const char* path) noexcept;

    FileWriter(const FileWriter&)            = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    THINIO_HANDLE_EXPORT
    FileWriter(FileWriter&& other) noexcept;
    THINIO_HANDLE_EXPORT
    FileWriter& operator=(FileWriter&& other) noexcept;
    /// @brief Closes the file (errors are not reported, flush first)
    THINIO_HANDLE_EXPORT
    ~FileWriter();

    THINIO_HANDLE_EXPORT
    WriteResult write(std::span<const std::byte> data) noexcept;
    THINIO_HANDLE_EXPORT
    FlushResult flush() noexcept;
  };
  static_assert(IsWriter<FileWriter>);
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_WRITERS
