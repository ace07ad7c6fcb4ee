/*****************************************************************/ /**
 * @file   owned.h
 * @brief  Contains `OwnedFileHandle`, the single owner of a handle.
 *
 * @date   October 2026
 *********************************************************************/
#ifndef __HG_THINIO_HANDLE_OWNED
#define __HG_THINIO_HANDLE_OWNED

#include <algorithm>
#include <concepts>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <thinio_handle/file_handle.h>

namespace thinio
{
  /// @brief Owns a handle and destroys it exactly once.
  /// The wrapper is exactly one pointer. An empty wrapper (default
  /// constructed, moved-from or released through `into_raw`) owns
  /// nothing: it is the nullable form of the handle, and costs nothing more.
  /// @code{.cpp}
  /// OwnedFileHandle out{FileWriter::create("log.txt").value()};
  /// if (auto res = out.write_all(bytes); res.is_error())
  ///   return res;
  /// // the handle can cross the boundary and come back
  /// auto back = OwnedFileHandle::from_raw(std::move(out).into_raw());
  /// @endcode
  class OwnedFileHandle
  {
    /// @brief The owned handle, or nullptr if empty
    FileHandle* _handle = nullptr;

    explicit OwnedFileHandle(FileHandle* handle) noexcept
        : _handle(handle)
    {
    }

  public:
    /// @brief Constructs an empty wrapper
    constexpr OwnedFileHandle() noexcept = default;

    /// @brief Constructs a handle owning `writer`.
    /// Allocation failure calls `alloc::handle_alloc_fail`.
    /// @param writer The writer to move (or copy) into the handle
    template<typename W>
      requires(!std::same_as<std::remove_cvref_t<W>, OwnedFileHandle>)
              && IsWriter<std::remove_cvref_t<W>>
              && std::constructible_from<std::remove_cvref_t<W>, W&&>
    explicit OwnedFileHandle(W&& writer)
        : _handle(for_writer(std::forward<W>(writer)))
    {
    }

    /// @brief Takes ownership of a raw handle.
    /// No other wrapper may own `handle`, and it must not be destroyed
    /// through another path.
    /// @param handle The handle (not null)
    /// @return The wrapper owning `handle`
    static OwnedFileHandle from_raw(FileHandle* handle) noexcept
    {
      THINIO_pre(handle != nullptr, "expected a non-null handle");
      return OwnedFileHandle{handle};
    }

    /// @brief Releases ownership of the handle, leaving the wrapper empty.
    /// The caller becomes responsible for destroying the handle.
    /// @return The handle (nullptr if the wrapper was empty)
    [[nodiscard]] FileHandle* into_raw() && noexcept
    {
      return std::exchange(_handle, nullptr);
    }

    OwnedFileHandle(const OwnedFileHandle&)            = delete;
    OwnedFileHandle& operator=(const OwnedFileHandle&) = delete;

    OwnedFileHandle(OwnedFileHandle&& other) noexcept
        : _handle(std::exchange(other._handle, nullptr))
    {
    }

    OwnedFileHandle& operator=(OwnedFileHandle&& other) noexcept
    {
      if (this != &other)
      {
        thinio::destroy(_handle);
        _handle = std::exchange(other._handle, nullptr);
      }
      return *this;
    }

    /// @brief Destroys the handle, if any
    ~OwnedFileHandle() { thinio::destroy(_handle); }

    /// @brief Returns the handle without releasing it (nullptr if empty)
    FileHandle* get() const noexcept { return _handle; }
    /// @brief Check if the wrapper owns a handle
    explicit operator bool() const noexcept { return _handle != nullptr; }

    /// @brief Check if the payload is exactly a `T`
    /// @pre The wrapper is not empty
    template<typename T>
    bool is() const noexcept
    {
      THINIO_pre(_handle != nullptr, "empty OwnedFileHandle");
      return thinio::is<T>(_handle);
    }

    /// @brief Returns the payload if it is exactly a `T` (and not poisoned)
    /// @pre The wrapper is not empty
    template<IsWriter T>
    const T* downcast_ref() const noexcept
    {
      THINIO_pre(_handle != nullptr, "empty OwnedFileHandle");
      return thinio::downcast_ref<T>(_handle);
    }

    /// @brief Returns the payload if it is exactly a `T` (and not poisoned)
    /// @pre The wrapper is not empty
    template<IsWriter T>
    T* downcast_mut() noexcept
    {
      THINIO_pre(_handle != nullptr, "empty OwnedFileHandle");
      return thinio::downcast_mut<T>(_handle);
    }

    /// @brief Moves the payload out of the handle if it is exactly a `T`.
    /// On success the representation is released without destroying
    /// the handle a second time: the wrapper is left empty.
    /// On failure (wrong type or poisoned handle) the wrapper is returned
    /// unchanged as the error.
    /// @pre The wrapper is not empty
    /// @return The payload, or the unchanged wrapper
    template<IsWriter T>
    Expected<T, OwnedFileHandle> downcast() &&
    {
      THINIO_pre(_handle != nullptr, "empty OwnedFileHandle");
      if (!thinio::is<T>(_handle) || thinio::is_poisoned(_handle))
        return {unexpected, std::move(*this)};

      T* writer = detail::Repr<T>::writer_of(_handle);
      Expected<T, OwnedFileHandle> result(in_place, std::move(*writer));
      std::destroy_at(writer);
      detail::release_representation(std::exchange(_handle, nullptr));
      return result;
    }

    /// @brief Writes bytes to the handle
    /// @pre The wrapper is not empty
    WriteResult write(std::span<const std::byte> data) noexcept
    {
      return thinio::write(_handle, data);
    }

    /// @brief Writes the characters of a string to the handle
    /// @pre The wrapper is not empty
    WriteResult write(std::string_view str) noexcept
    {
      return thinio::write(_handle, std::as_bytes(std::span{str.data(), str.size()}));
    }

    /// @brief Writes all the bytes, calling `write` as many times as needed.
    /// A write accepting no bytes is reported as `IoErrorKind::Other`.
    /// @pre The wrapper is not empty
    FlushResult write_all(std::span<const std::byte> data) noexcept
    {
      while (!data.empty())
      {
        auto written = thinio::write(_handle, data);
        if (written.is_error())
          return {unexpected, written.error()};
        if (*written == 0)
          return {unexpected, IoError::other()};
        data = data.subspan(std::min(*written, data.size()));
      }
      return {};
    }

    /// @brief Flushes the handle
    /// @pre The wrapper is not empty
    FlushResult flush() noexcept { return thinio::flush(_handle); }

    /// @brief Check if the handle is poisoned
    /// @pre The wrapper is not empty
    bool is_poisoned() const noexcept
    {
      THINIO_pre(_handle != nullptr, "empty OwnedFileHandle");
      return thinio::is_poisoned(_handle);
    }
  };

  static_assert(sizeof(OwnedFileHandle) == sizeof(FileHandle*));
} // namespace thinio

#endif // !__HG_THINIO_HANDLE_OWNED
