#include <doctest/doctest.h>
#include <cstring>
#include <optional>
#include <string_view>
#include <thread>

#include <thinio_handle/owned.h>
#include <thinio_handle/writers.h>
#include "test_writers.h"

using namespace thinio;

namespace
{
  int poison_reports = 0;
  const FileHandle* last_poisoned = nullptr;
  std::string_view last_operation;

  void count_poison(const FileHandle* handle, const char* operation, const char*) noexcept
  {
    ++poison_reports;
    last_poisoned  = handle;
    last_operation = operation;
  }

  /// @brief Replaces the poison hook for the lifetime of the object
  struct ScopedPoisonHook
  {
    on_poison_fn_t previous;

    ScopedPoisonHook() noexcept
        : previous(register_on_poison(&count_poison))
    {
      poison_reports = 0;
      last_poisoned  = nullptr;
      last_operation = {};
    }
    ~ScopedPoisonHook() { register_on_poison(previous); }
  };
} // namespace

TEST_CASE("thinio/owned")
{
  SUBCASE("the nullable form costs nothing")
  {
    static_assert(sizeof(OwnedFileHandle) == sizeof(void*));
    OwnedFileHandle empty;
    CHECK_FALSE(empty);
    CHECK(empty.get() == nullptr);
    CHECK(std::move(empty).into_raw() == nullptr);
  }

  SUBCASE("moves transfer ownership, destroying exactly once")
  {
    int destroyed = 0;
    {
      OwnedFileHandle a{DropCounter{&destroyed}};
      OwnedFileHandle b = std::move(a);
      CHECK_FALSE(a);
      CHECK(b);
      OwnedFileHandle c{NullWriter{}};
      c = std::move(b);
      CHECK(destroyed == 0);
      CHECK(c.is<DropCounter>());
    }
    CHECK(destroyed == 1);

    // assigning over a live handle destroys it
    OwnedFileHandle d{DropCounter{&destroyed}};
    d = OwnedFileHandle{NullWriter{}};
    CHECK(destroyed == 2);
  }

  SUBCASE("raw round trip keeps a single owner")
  {
    int destroyed = 0;
    OwnedFileHandle owned{DropCounter{&destroyed}};
    FileHandle* raw = std::move(owned).into_raw();
    CHECK_FALSE(owned);
    CHECK(destroyed == 0);

    auto back = OwnedFileHandle::from_raw(raw);
    CHECK(back.get() == raw);
    back = OwnedFileHandle{};
    CHECK(destroyed == 1);
  }

  SUBCASE("downcast_ref and downcast_mut")
  {
    OwnedFileHandle owned{ChunkedWriter{4, {}}};
    CHECK(owned.downcast_ref<NullWriter>() == nullptr);
    CHECK(owned.downcast_mut<SharedBuffer>() == nullptr);

    CHECK(owned.write("abcdef").value() == 4);
    auto* chunked = owned.downcast_mut<ChunkedWriter>();
    REQUIRE(chunked != nullptr);
    CHECK(chunked->bytes.size() == 4);
    chunked->chunk = 16;
    CHECK(owned.write("abcdef").value() == 6);
    CHECK(owned.downcast_ref<ChunkedWriter>()->bytes.size() == 10);
  }

  SUBCASE("downcast moves the payload out")
  {
    int destroyed = 0;
    OwnedFileHandle owned{DropCounter{&destroyed}};
    auto result = std::move(owned).downcast<DropCounter>();
    REQUIRE(result.is_expect());
    CHECK_FALSE(owned);
    // only the moved-from payload was destroyed, silently
    CHECK(destroyed == 0);
    CHECK(result->destroyed == &destroyed);

    std::optional<DropCounter> extracted{std::move(*result)};
    result = Expected<DropCounter, OwnedFileHandle>{unexpected, OwnedFileHandle{}};
    extracted.reset();
    CHECK(destroyed == 1);
  }

  SUBCASE("downcast to the wrong type gives the handle back untouched")
  {
    int destroyed = 0;
    OwnedFileHandle owned{DropCounter{&destroyed}};
    FileHandle* raw = owned.get();

    auto result = std::move(owned).downcast<SharedBuffer>();
    REQUIRE(result.is_error());
    CHECK(destroyed == 0);
    OwnedFileHandle back = std::move(result).error();
    CHECK(back.get() == raw);
    CHECK(back.is<DropCounter>());

    auto again = std::move(back).downcast<DropCounter>();
    CHECK(again.is_expect());
    CHECK(destroyed == 0);
  }

  SUBCASE("write_all loops over partial writes")
  {
    OwnedFileHandle owned{ChunkedWriter{3, {}}};
    const char message[] = "0123456789";
    REQUIRE(owned.write_all(bytes_of(message)).is_expect());
    const auto& bytes = owned.downcast_ref<ChunkedWriter>()->bytes;
    REQUIRE(bytes.size() == 10);
    CHECK(std::memcmp(bytes.data(), message, 10) == 0);

    OwnedFileHandle stuck{ChunkedWriter{0, {}}};
    auto res = stuck.write_all(bytes_of("x"));
    REQUIRE(res.is_error());
    CHECK(res.error().kind() == IoErrorKind::Other);

    OwnedFileHandle failing{FailingWriter{5}};
    CHECK(failing.write_all(bytes_of("x")).error().raw_os_error() == 5);
  }

  SUBCASE("a throwing operation poisons the handle")
  {
    ScopedPoisonHook hook;
    int calls      = 0;
    bool destroyed = false;
    {
      OwnedFileHandle owned{ThrowingWriter{&calls, &destroyed}};
      CHECK_FALSE(owned.is_poisoned());

      auto res = owned.write("boom");
      REQUIRE(res.is_error());
      CHECK(res.error().kind() == IoErrorKind::Poisoned);
      CHECK(calls == 1);
      CHECK(owned.is_poisoned());
      CHECK(poison_reports == 1);
      CHECK(last_poisoned == owned.get());
      CHECK(last_operation == "write");

      // the payload is never reached again
      CHECK(owned.write("again").error().kind() == IoErrorKind::AlreadyPoisoned);
      CHECK(owned.flush().error().kind() == IoErrorKind::AlreadyPoisoned);
      CHECK(calls == 1);
      CHECK(poison_reports == 1);

      // the type did not change, but the payload is not reachable
      CHECK(owned.is<ThrowingWriter>());
      CHECK(owned.downcast_ref<ThrowingWriter>() == nullptr);
      auto rejected = std::move(owned).downcast<ThrowingWriter>();
      REQUIRE(rejected.is_error());
      owned = std::move(rejected).error();
    }
    // the destructor of the payload was skipped
    CHECK_FALSE(destroyed);
  }

  SUBCASE("a throwing flush poisons the handle")
  {
    ScopedPoisonHook hook;
    int writes     = 0;
    bool destroyed = false;
    {
      OwnedFileHandle owned{FlushThrowingWriter{&writes, &destroyed}};
      CHECK(*owned.write("data") == 4);
      CHECK(writes == 1);

      auto res = owned.flush();
      REQUIRE(res.is_error());
      CHECK(res.error().kind() == IoErrorKind::Poisoned);
      CHECK(owned.is_poisoned());
      CHECK(poison_reports == 1);
      CHECK(last_operation == "flush");

      CHECK(owned.write("more").error().kind() == IoErrorKind::AlreadyPoisoned);
      CHECK(owned.flush().error().kind() == IoErrorKind::AlreadyPoisoned);
      CHECK(writes == 1);
      CHECK(poison_reports == 1);
    }
    CHECK_FALSE(destroyed);
  }

  SUBCASE("ownership can cross threads")
  {
    SharedBuffer buffer;
    OwnedFileHandle owned{buffer};
    std::thread worker(
        [moved = std::move(owned)]() mutable
        {
          CHECK(moved.write_all(bytes_of("from another thread")).is_expect());
          CHECK(moved.flush().is_expect());
        });
    worker.join();
    CHECK(buffer.contents().size() == sizeof("from another thread") - 1);
    CHECK(buffer.state->flushes == 1);
  }
}
