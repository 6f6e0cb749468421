#include <catch2/catch.hpp>

#include "test_util.hpp"

#include <pbe/io.hpp>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

using namespace pbe;

TEST_CASE("Profile columns skip comment lines", "[io]")
{
  pbe_test::TempDir tmp("io_read");

  SECTION("single column")
  {
    const std::string path = pbe_test::write_text(tmp.file("one.dat"),
        "# header\n"
        "@    title \"eps\"\n"
        "0.1\n"
        "\n"
        "  0.2\n"
        "3e-1\n");
    CHECK(read_profile_column(path) == std::vector<double>{0.1, 0.2, 0.3});
  }

  SECTION("z, value columns")
  {
    const std::string path = pbe_test::write_text(tmp.file("two.xvg"),
        "@ xaxis label \"z\"\n"
        "0.0 1.5\n"
        "0.1 2.5 9.0\n");
    CHECK(read_profile_column(path) == std::vector<double>{1.5, 2.5});
  }

  SECTION("errors")
  {
    CHECK_THROWS_AS(read_profile_column(tmp.file("none.dat")), std::runtime_error);
    CHECK_THROWS_AS(read_profile_column(pbe_test::write_text(tmp.file("bad.dat"), "0.1\nabc\n")),
                    std::runtime_error);
    CHECK_THROWS_AS(read_profile_column(pbe_test::write_text(tmp.file("empty.dat"), "# only\n")),
                    std::runtime_error);
  }
}

TEST_CASE("Tables get commented headers", "[io]")
{
  pbe_test::TempDir tmp("io_write");
  const std::string path = tmp.file("t.txt");
  write_table(path, {"z", "psi"}, {{0.0, 1.0, 2.0}, {5.0, 4.0, 3.0}}, "line one\nline two");

  std::ifstream in(path);
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) lines.push_back(line);

  REQUIRE(lines.size() == 6);
  CHECK(lines[0] == "# line one");
  CHECK(lines[1] == "# line two");
  CHECK(lines[2] == "# z psi");

  // Written values read back through the profile reader (second column).
  CHECK(read_profile_column(path) == std::vector<double>{5.0, 4.0, 3.0});

  CHECK_THROWS_AS(write_table(path, {"z"}, {{0.0}, {1.0}}), std::runtime_error);
  CHECK_THROWS_AS(write_table(path, {"z", "psi"}, {{0.0}, {1.0, 2.0}}), std::runtime_error);
}

TEST_CASE("Config copies are byte-identical", "[io]")
{
  pbe_test::TempDir tmp("io_copy");
  const std::string src = pbe_test::write_text(tmp.file("a.ini"), "[system]\nbins = 10\n");
  ensure_dir(tmp.file("sub/dir"));
  copy_file(src, tmp.file("sub/dir/b.ini"));

  std::ifstream in(tmp.file("sub/dir/b.ini"));
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  CHECK(text == "[system]\nbins = 10\n");

  CHECK_THROWS_AS(copy_file(tmp.file("nope.ini"), tmp.file("c.ini")), std::runtime_error);
}
