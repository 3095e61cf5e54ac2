#include <functional>

#include <elle/filesystem/TemporaryDirectory.hh>
#include <elle/printf.hh>
#include <elle/test.hh>

#include <morceau/Error.hh>
#include <morceau/Merge.hh>
#include <morceau/Part.hh>
#include <morceau/Split.hh>

#include "backends.hh"
#include "files.hh"

ELLE_LOG_COMPONENT("morceau.tests.Merge");

static
morceau::MergeConfig
config(boost::filesystem::path const& in,
       boost::filesystem::path const& out)
{
  return morceau::MergeConfig().in_dir(in).out_file(out);
}

static
void
expect_kind(std::function<void ()> const& action,
            morceau::Error::Kind kind)
{
  try
  {
    action();
    BOOST_FAIL(elle::sprintf("no %s error raised", kind));
  }
  catch (morceau::Error const& e)
  {
    ELLE_LOG("caught expected error: %s", e.what());
    BOOST_CHECK_EQUAL(e.kind(), kind);
  }
}

static
void
digits()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  write_file(parts / "part_0", "0123");
  write_file(parts / "part_1", "4567");
  write_file(parts / "part_2", "89");
  auto res = morceau::merge(config(parts, out));
  BOOST_CHECK_EQUAL(res.total_size, 10u);
  BOOST_CHECK_EQUAL(res.part_count, 3u);
  BOOST_CHECK_EQUAL(read_file(out), "0123456789");
  // Parts are left in place.
  BOOST_CHECK_EQUAL(read_file(parts / "part_1"), "4567");
}

static
void
round_trip()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto in = tmp.path() / "in.bin";
  auto const content = pattern(64 * 1024 + 17);
  write_file(in, content);
  for (morceau::FileSize chunk: {1000, 4096, 65536, 1 << 20})
  {
    auto parts = tmp.path() / elle::sprintf("parts-%s", chunk);
    auto out = tmp.path() / elle::sprintf("out-%s.bin", chunk);
    auto split_res = morceau::split(
      morceau::SplitConfig().in_file(in).out_dir(parts).chunk_size(chunk));
    auto merge_res = morceau::merge(config(parts, out).buffer_capacity(1024));
    BOOST_CHECK_EQUAL(merge_res.part_count, split_res.part_count);
    BOOST_CHECK_EQUAL(merge_res.total_size, content.size());
    BOOST_CHECK(read_file(out) == content);
  }
}

static
void
numeric_order()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  std::string expected;
  // Created backwards, and lexicographic order would put part_10 first.
  for (int i = 11; i >= 0; --i)
    write_file(parts / morceau::Part::name(i), elle::sprintf("<%s>", i));
  for (int i = 0; i < 12; ++i)
    expected += elle::sprintf("<%s>", i);
  auto res = morceau::merge(config(parts, tmp.path() / "out.bin"));
  BOOST_CHECK_EQUAL(res.part_count, 12u);
  BOOST_CHECK_EQUAL(read_file(tmp.path() / "out.bin"), expected);
}

static
void
leading_zeros()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  write_file(parts / "part_000", "a");
  write_file(parts / "part_001", "b");
  write_file(parts / "part_2", "c");
  morceau::merge(config(parts, tmp.path() / "out.bin"));
  BOOST_CHECK_EQUAL(read_file(tmp.path() / "out.bin"), "abc");
}

static
void
foreign_entries()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  write_file(parts / "part_0", "01");
  write_file(parts / "part_1", "23");
  write_file(parts / "README", "not a part");
  write_file(parts / "part_x", "not a part either");
  write_file(parts / "part_", "nor this");
  boost::filesystem::create_directories(parts / "part_2");
  auto res = morceau::merge(config(parts, tmp.path() / "out.bin"));
  BOOST_CHECK_EQUAL(res.part_count, 2u);
  BOOST_CHECK_EQUAL(read_file(tmp.path() / "out.bin"), "0123");
}

static
void
gap()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  write_file(parts / "part_0", "0123");
  write_file(parts / "part_2", "89");
  write_file(parts / "part_3", "xx");
  expect_kind([&] { morceau::merge(config(parts, out)); },
              morceau::Error::Kind::corrupt);
  BOOST_CHECK(!boost::filesystem::exists(out));
}

static
void
duplicate()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  write_file(parts / "part_0", "0123");
  write_file(parts / "part_1", "4567");
  write_file(parts / "part_01", "4567");
  expect_kind([&] { morceau::merge(config(parts, out)); },
              morceau::Error::Kind::corrupt);
  BOOST_CHECK(!boost::filesystem::exists(out));
}

static
void
no_parts()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  boost::filesystem::create_directories(parts);
  expect_kind([&] { morceau::merge(config(parts, out)); },
              morceau::Error::Kind::corrupt);
  write_file(parts / "README", "");
  expect_kind([&] { morceau::merge(config(parts, out)); },
              morceau::Error::Kind::corrupt);
  BOOST_CHECK(!boost::filesystem::exists(out));
}

static
void
missing_directory()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto out = tmp.path() / "out.bin";
  expect_kind([&] { morceau::merge(config(tmp.path() / "nope", out)); },
              morceau::Error::Kind::not_found);
  BOOST_CHECK(!boost::filesystem::exists(out));
}

static
void
input_is_file()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto in = tmp.path() / "part_0";
  write_file(in, "0123");
  expect_kind([&] { morceau::merge(config(in, tmp.path() / "out.bin")); },
              morceau::Error::Kind::invalid_input);
}

static
void
output_is_directory()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out";
  write_file(parts / "part_0", "0123");
  write_file(out / "keep", "precious");
  expect_kind([&] { morceau::merge(config(parts, out)); },
              morceau::Error::Kind::invalid_input);
  BOOST_CHECK_EQUAL(read_file(out / "keep"), "precious");
}

static
void
create_output_parent()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "a" / "b" / "out.bin";
  write_file(parts / "part_0", "0123");
  morceau::merge(config(parts, out));
  BOOST_CHECK_EQUAL(read_file(out), "0123");
}

static
void
overwrite()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  write_file(parts / "part_0", "0123");
  write_file(parts / "part_1", "45");
  write_file(out, "a much longer previous content");
  morceau::merge(config(parts, out));
  BOOST_CHECK_EQUAL(read_file(out), "012345");
  morceau::merge(config(parts, out));
  BOOST_CHECK_EQUAL(read_file(out), "012345");
}

static
void
empty_part()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto in = tmp.path() / "in.bin";
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  write_file(in, "");
  morceau::split(morceau::SplitConfig().in_file(in).out_dir(parts));
  auto res = morceau::merge(config(parts, out));
  BOOST_CHECK_EQUAL(res.total_size, 0u);
  BOOST_CHECK_EQUAL(res.part_count, 1u);
  BOOST_CHECK(boost::filesystem::is_regular_file(out));
  BOOST_CHECK_EQUAL(boost::filesystem::file_size(out), 0u);
}

static
void
invalid_configuration()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  write_file(parts / "part_0", "0123");
  BOOST_CHECK_THROW(
    morceau::merge(morceau::MergeConfig().in_dir(parts)),
    morceau::InvalidInput);
  BOOST_CHECK_THROW(
    morceau::merge(morceau::MergeConfig().out_file(tmp.path() / "out.bin")),
    morceau::InvalidInput);
  BOOST_CHECK_THROW(
    morceau::merge(config(parts, tmp.path() / "out.bin").buffer_capacity(0)),
    morceau::InvalidInput);
}

static
void
write_failure()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  write_file(parts / "part_0", "0123");
  write_file(parts / "part_1", "4567");
  write_file(parts / "part_2", "89");
  // The output fails on its second write.
  Instrumented backend(0, 1);
  expect_kind(
    [&] { morceau::merge(config(parts, out).buffer_capacity(4), backend); },
    morceau::Error::Kind::io);
  BOOST_CHECK_EQUAL(read_file(out), "0123");
}

static
void
small_first_part()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  auto out = tmp.path() / "out.bin";
  auto const content = pattern(8192);
  write_file(parts / "part_0", "a");
  write_file(parts / "part_1", content.substr(0, 4096));
  write_file(parts / "part_2", content.substr(4096));
  Instrumented backend;
  auto res = morceau::merge(config(parts, out), backend);
  BOOST_CHECK_EQUAL(res.total_size, 8193u);
  // One write per part: the buffer fits the largest one.
  BOOST_CHECK_EQUAL(backend.writes(), 3);
  BOOST_CHECK(read_file(out) == "a" + content);
}

static
void
output_is_part()
{
  elle::filesystem::TemporaryDirectory tmp("merge");
  auto parts = tmp.path() / "parts";
  write_file(parts / "part_0", "0123");
  write_file(parts / "part_1", "4567");
  expect_kind([&] { morceau::merge(config(parts, parts / "part_1")); },
              morceau::Error::Kind::invalid_input);
  expect_kind(
    [&]
    {
      morceau::merge(config(parts, parts / ".." / "parts" / "part_0"));
    },
    morceau::Error::Kind::invalid_input);
  BOOST_CHECK_EQUAL(read_file(parts / "part_0"), "0123");
  BOOST_CHECK_EQUAL(read_file(parts / "part_1"), "4567");
}

ELLE_TEST_SUITE()
{
  auto& suite = boost::unit_test::framework::master_test_suite();
  suite.add(BOOST_TEST_CASE(digits), 0, 10);
  suite.add(BOOST_TEST_CASE(round_trip), 0, 30);
  suite.add(BOOST_TEST_CASE(numeric_order), 0, 10);
  suite.add(BOOST_TEST_CASE(leading_zeros), 0, 10);
  suite.add(BOOST_TEST_CASE(foreign_entries), 0, 10);
  suite.add(BOOST_TEST_CASE(gap), 0, 10);
  suite.add(BOOST_TEST_CASE(duplicate), 0, 10);
  suite.add(BOOST_TEST_CASE(no_parts), 0, 10);
  suite.add(BOOST_TEST_CASE(missing_directory), 0, 10);
  suite.add(BOOST_TEST_CASE(input_is_file), 0, 10);
  suite.add(BOOST_TEST_CASE(output_is_directory), 0, 10);
  suite.add(BOOST_TEST_CASE(create_output_parent), 0, 10);
  suite.add(BOOST_TEST_CASE(overwrite), 0, 10);
  suite.add(BOOST_TEST_CASE(empty_part), 0, 10);
  suite.add(BOOST_TEST_CASE(invalid_configuration), 0, 10);
  suite.add(BOOST_TEST_CASE(write_failure), 0, 10);
  suite.add(BOOST_TEST_CASE(small_first_part), 0, 10);
  suite.add(BOOST_TEST_CASE(output_is_part), 0, 10);
}
