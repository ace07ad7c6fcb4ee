#include <doctest/doctest.h>
#include <cerrno>

#include <thinio_vocabular/io_error.h>

using namespace thinio;

TEST_CASE("thinio/io_error")
{
  SUBCASE("platform errors keep their code")
  {
    auto err = IoError::from_raw_os_error(42);
    CHECK(err.kind() == IoErrorKind::Os);
    REQUIRE(err.raw_os_error().has_value());
    CHECK(*err.raw_os_error() == 42);
    CHECK(err.to_status() == -42);
    CHECK_FALSE(err.is_poison());
  }

  SUBCASE("handle specific kinds carry no platform code")
  {
    CHECK_FALSE(IoError::poisoned().raw_os_error().has_value());
    CHECK(IoError::poisoned().is_poison());
    CHECK(IoError::already_poisoned().is_poison());
    CHECK_FALSE(IoError::malformed().is_poison());
  }

  SUBCASE("status translation is lossless")
  {
    const IoError errors[] = {
        IoError::from_raw_os_error(1),
        IoError::from_raw_os_error(ENOSPC),
        IoError::poisoned(),
        IoError::already_poisoned(),
        IoError::malformed(),
        IoError::other(),
    };
    for (const auto& err : errors)
    {
      CHECK(err.to_status() < 0);
      CHECK(IoError::from_status(err.to_status()) == err);
    }
  }

  SUBCASE("sentinels never collide with platform codes")
  {
    CHECK(STATUS_POISONED < -65535);
    CHECK(STATUS_ALREADY_POISONED < -65535);
    CHECK(STATUS_MALFORMED < -65535);
    CHECK(STATUS_OTHER < -65535);
  }

  SUBCASE("last_os_error reads errno")
  {
    errno    = ENOENT;
    auto err = IoError::last_os_error();
    CHECK(err.raw_os_error() == ENOENT);

    errno = 0;
    CHECK(IoError::last_os_error().kind() == IoErrorKind::Other);
  }
}
