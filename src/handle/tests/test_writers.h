/*****************************************************************/ /**
 * @file   test_writers.h
 * @brief  Writers used by the handle tests.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_TESTS_TEST_WRITERS
#define __HG_THINIO_HANDLE_TESTS_TEST_WRITERS

#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <thinio_handle/writer.h>

/// @brief In-memory sink shared between the test and the handle
struct SharedBuffer
{
  struct State
  {
    std::mutex mutex;
    std::vector<std::byte> bytes;
    int flushes = 0;
  };

  std::shared_ptr<State> state = std::make_shared<State>();

  thinio::WriteResult write(std::span<const std::byte> data)
  {
    std::scoped_lock lock{state->mutex};
    state->bytes.insert(state->bytes.end(), data.begin(), data.end());
    return data.size();
  }

  thinio::FlushResult flush()
  {
    std::scoped_lock lock{state->mutex};
    ++state->flushes;
    return {};
  }

  std::vector<std::byte> contents() const
  {
    std::scoped_lock lock{state->mutex};
    return state->bytes;
  }
};

/// @brief Counts its destructions through `destroyed`
struct DropCounter
{
  int* destroyed;

  explicit DropCounter(int* counter) noexcept
      : destroyed(counter)
  {
  }
  DropCounter(DropCounter&& other) noexcept
      : destroyed(std::exchange(other.destroyed, nullptr))
  {
  }
  DropCounter& operator=(DropCounter&&) = delete;
  ~DropCounter()
  {
    if (destroyed != nullptr)
      ++*destroyed;
  }

  thinio::WriteResult write(std::span<const std::byte> data) { return data.size(); }
  thinio::FlushResult flush() { return {}; }
};

/// @brief Fails every operation with the same platform error
struct FailingWriter
{
  int code;

  thinio::WriteResult write(std::span<const std::byte>)
  {
    return {thinio::unexpected, thinio::IoError::from_raw_os_error(code)};
  }
  thinio::FlushResult flush()
  {
    return {thinio::unexpected, thinio::IoError::from_raw_os_error(code)};
  }
};

/// @brief Throws from `write`, records every call and its destruction
struct ThrowingWriter
{
  int* calls;
  bool* destroyed;

  ThrowingWriter(int* calls, bool* destroyed) noexcept
      : calls(calls)
      , destroyed(destroyed)
  {
  }
  ThrowingWriter(ThrowingWriter&& other) noexcept
      : calls(other.calls)
      , destroyed(std::exchange(other.destroyed, nullptr))
  {
  }
  ThrowingWriter& operator=(ThrowingWriter&&) = delete;
  ~ThrowingWriter()
  {
    if (destroyed != nullptr)
      *destroyed = true;
  }

  thinio::WriteResult write(std::span<const std::byte>)
  {
    ++*calls;
    throw std::runtime_error("disk on fire");
  }
  thinio::FlushResult flush()
  {
    ++*calls;
    return {};
  }
};

/// @brief Throws from `flush`, counts writes and records its destruction
struct FlushThrowingWriter
{
  int* writes;
  bool* destroyed;

  FlushThrowingWriter(int* writes, bool* destroyed) noexcept
      : writes(writes)
      , destroyed(destroyed)
  {
  }
  FlushThrowingWriter(FlushThrowingWriter&& other) noexcept
      : writes(other.writes)
      , destroyed(std::exchange(other.destroyed, nullptr))
  {
  }
  FlushThrowingWriter& operator=(FlushThrowingWriter&&) = delete;
  ~FlushThrowingWriter()
  {
    if (destroyed != nullptr)
      *destroyed = true;
  }

  thinio::WriteResult write(std::span<const std::byte> data)
  {
    ++*writes;
    return data.size();
  }
  thinio::FlushResult flush() { throw std::runtime_error("fsync failed"); }
};

/// @brief Writes at most `chunk` bytes per call
struct ChunkedWriter
{
  std::size_t chunk;
  std::vector<std::byte> bytes;

  thinio::WriteResult write(std::span<const std::byte> data)
  {
    const auto n = data.size() < chunk ? data.size() : chunk;
    bytes.insert(bytes.end(), data.begin(), data.begin() + n);
    return n;
  }
  thinio::FlushResult flush() { return {}; }
};

/// @brief Converts a string literal to bytes (without the terminator)
template<std::size_t N>
std::span<const std::byte> bytes_of(const char (&str)[N]) noexcept
{
  return std::as_bytes(std::span{str, N - 1});
}

#endif // !__HG_THINIO_HANDLE_TESTS_TEST_WRITERS
