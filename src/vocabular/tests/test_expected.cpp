#include <doctest/doctest.h>

#include <memory>
#include <string>
#include <utility>

#include <thinio_vocabular/expected.h>

using namespace thinio;

// A move-only type to exercise move paths
struct MoveOnly
{
  std::unique_ptr<int> v;

  explicit MoveOnly(int x)
      : v(std::make_unique<int>(x))
  {
  }
};

static Expected<int, std::string> half_if_even(int x)
{
  if (x % 2 == 0)
    return x / 2;
  return {unexpected, std::string("odd")};
}

static Expected<void, std::string> check_positive(int x)
{
  if (x > 0)
    return {};
  return {unexpected, std::string("not positive")};
}

TEST_CASE("thinio/expected")
{
  SUBCASE("value and error construction")
  {
    Expected<int, std::string> a(12);
    CHECK(a.is_expect());
    CHECK(a);
    CHECK(*a == 12);

    std::string msg = "nope";
    Expected<int, std::string> e(unexpected, msg);
    CHECK(e.is_error());
    CHECK(!e);
    CHECK(e.error() == "nope");

    Expected<std::string, int> in_place_value(in_place, 4, 'x');
    CHECK(in_place_value.value() == "xxxx");

    CHECK(*half_if_even(8) == 4);
    auto odd = half_if_even(3);
    REQUIRE(odd.is_error());
    CHECK(odd.error() == "odd");
  }

  SUBCASE("move-only values and errors")
  {
    Expected<MoveOnly, int> value(MoveOnly{3});
    REQUIRE(value.is_expect());
    MoveOnly moved = std::move(value).value();
    CHECK(*moved.v == 3);

    Expected<int, MoveOnly> error(unexpected, MoveOnly{5});
    REQUIRE(error.is_error());
    Expected<int, MoveOnly> other = std::move(error);
    CHECK(*other.error().v == 5);
  }

  SUBCASE("move assignment switches the active member")
  {
    Expected<std::string, int> x(std::string("value"));
    x = Expected<std::string, int>(unexpected, 7);
    CHECK(x.is_error());
    CHECK(x.error() == 7);
    x = Expected<std::string, int>(std::string("again"));
    CHECK(x.value() == "again");
  }

  SUBCASE("void specialization")
  {
    auto ok = check_positive(1);
    CHECK(ok.is_expect());
    CHECK(ok);

    auto err = check_positive(0);
    CHECK(err.is_error());
    CHECK(err.error() == "not positive");

    Expected<void, std::string> copy = err;
    CHECK(copy.error() == "not positive");
    copy = Expected<void, std::string>{};
    CHECK(copy.is_expect());
  }
}
