#include <doctest/doctest.h>
#include <thinio_contracts/contracts.h>
#include <string_view>

static unsigned violation_counts = 0;
static thinio::contracts::Kind last_kind = thinio::contracts::Kind::Assert;

static void count_violation(
    const char*, const char*, thinio::contracts::Kind kind,
    const std::optional<std::source_location>&) noexcept
{
  ++violation_counts;
  last_kind = kind;
}

// All three kinds of checks must be usable in constant expressions
static constexpr int checked_half(int x) noexcept
{
  THINIO_pre(x % 2 == 0, "expected an even number");
  const int half = x / 2;
  THINIO_post(half * 2 == x, "halving must be exact");
  THINIO_assert(x < 0 || half >= 0, "sign must be kept");
  return half;
}
static_assert(checked_half(8) == 4);
static_assert(checked_half(-6) == -3);

TEST_CASE("thinio/contracts")
{
  using namespace thinio::contracts;

  // rather than aborting, count the violations.
  auto* previous  = register_violation_handler(&count_violation);
  violation_counts = 0;

  SUBCASE("passing checks do not call the handler")
  {
    THINIO_pre("evaluates to true", "");
    THINIO_post(10, "");
    THINIO_assert(1.0f, "");
    CHECK(violation_counts == 0);
  }

  SUBCASE("failing checks report their kind")
  {
    THINIO_pre(nullptr, "");
    CHECK(violation_counts == 1);
    CHECK(last_kind == Kind::Pre);

    THINIO_post(false, "");
    CHECK(violation_counts == 2);
    CHECK(last_kind == Kind::Post);

    THINIO_assert(0, "");
    CHECK(violation_counts == 3);
    CHECK(last_kind == Kind::Assert);
  }

  SUBCASE("constexpr checks report at runtime")
  {
    CHECK(checked_half(10) == 5);
    CHECK(violation_counts == 0);

    (void)checked_half(3);
    CHECK(violation_counts == 2);
    CHECK(last_kind == Kind::Post);
  }

  SUBCASE("debug checks only run on Debug config")
  {
    THINIO_debug_pre(false, "");
    THINIO_debug_assert(false, "");
#ifdef THINIO_DEBUG
    CHECK(violation_counts == 2);
    CHECK(last_kind == Kind::Assert);
#else
    CHECK(violation_counts == 0);
#endif
  }

  SUBCASE("kind names")
  {
    CHECK(std::string_view{to_string(Kind::Pre)} == "precondition");
    CHECK(std::string_view{to_string(Kind::Post)} == "postcondition");
    CHECK(std::string_view{to_string(Kind::Assert)} == "assertion");
  }

  CHECK(register_violation_handler(previous) == &count_violation);
}
