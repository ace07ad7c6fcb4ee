#include <doctest/doctest.h>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <thinio_handle/owned.h>
#include <thinio_handle/writers.h>
#include "test_writers.h"

using namespace thinio;

namespace
{
  std::string read_file(const std::filesystem::path& path)
  {
    std::ifstream in{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
  }
} // namespace

TEST_CASE("thinio/writers")
{
  const auto dir = std::filesystem::temp_directory_path();

  SUBCASE("NullWriter accepts everything")
  {
    OwnedFileHandle owned{NullWriter{}};
    CHECK(owned.write("discarded").value() == 9);
    CHECK(owned.write(std::span<const std::byte>{}).value() == 0);
    CHECK(owned.flush().is_expect());
  }

  SUBCASE("FileWriter writes the exact bytes")
  {
    const auto path = dir / "thinio_test_writers.bin";
    {
      auto writer = FileWriter::create(path.string().c_str());
      REQUIRE(writer.is_expect());
      OwnedFileHandle owned{std::move(writer).value()};
      const char data[] = "line 1\nline 2\n\0binary";
      REQUIRE(owned.write_all(bytes_of(data)).is_expect());
      REQUIRE(owned.flush().is_expect());
    }
    const auto contents = read_file(path);
    CHECK(contents == std::string("line 1\nline 2\n\0binary", 21));

    // creating again truncates
    {
      auto writer = FileWriter::create(path.string().c_str());
      REQUIRE(writer.is_expect());
    }
    CHECK(read_file(path).empty());
    std::filesystem::remove(path);
  }

  SUBCASE("FileWriter reports platform errors")
  {
    const auto path = dir / "thinio_missing_dir" / "out.txt";
    auto writer     = FileWriter::create(path.string().c_str());
    REQUIRE(writer.is_error());
    CHECK(writer.error().kind() == IoErrorKind::Os);
    CHECK(writer.error().raw_os_error() == ENOENT);
  }

  SUBCASE("FileWriter can be moved out of a handle")
  {
    const auto path = dir / "thinio_test_downcast.txt";
    auto writer     = FileWriter::create(path.string().c_str());
    REQUIRE(writer.is_expect());
    OwnedFileHandle owned{std::move(writer).value()};
    CHECK(owned.write("before").value() == 6);

    auto extracted = std::move(owned).downcast<FileWriter>();
    REQUIRE(extracted.is_expect());
    CHECK(extracted->write(bytes_of(", after")).value() == 7);
    CHECK(extracted->flush().is_expect());
    CHECK(read_file(path) == "before, after");
    std::filesystem::remove(path);
  }
}
