#include <doctest/doctest.h>

#include "r3lr0/archive/zip_archive.hpp"
#include "support/test_support.hpp"

using r3lr0::archive::zip_archive;
using r3lr0::test::zip_builder;

TEST_CASE("zip archive lists entries and data offsets") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string path = dir.file("pkg.zip");

  zip_builder builder;
  builder.add("AndroidManifest.xml", {1, 2, 3}).add("lib/x86_64/libprov.so", {9, 8, 7, 6}, 0, 4096);
  REQUIRE(r3lr0::test::write_file(path, builder.build()));

  auto opened = zip_archive::open(path);
  REQUIRE(opened.ok());
  CHECK(opened.value.entries().size() == 2);

  const auto* lib = opened.value.find("lib/x86_64/libprov.so");
  REQUIRE(lib != nullptr);
  CHECK(lib->mappable());
  CHECK(lib->uncompressed_size == 4);

  auto offset = opened.value.data_offset(*lib);
  REQUIRE(offset.has_value());
  CHECK(*offset % 4096 == 0);

  uint8_t first = 0;
  CHECK(r3lr0::util::read_fully_at(opened.value.fd(), &first, 1, *offset));
  CHECK(first == 9);
  CHECK(opened.value.find("lib/x86/libprov.so") == nullptr);
}

TEST_CASE("zip archive finds the end record behind a comment") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string path = dir.file("commented.zip");

  zip_builder builder;
  builder.add("a.txt", {'a'}).comment(std::string(300, 'c'));
  REQUIRE(r3lr0::test::write_file(path, builder.build()));

  auto opened = zip_archive::open(path);
  REQUIRE(opened.ok());
  REQUIRE(opened.value.find("a.txt") != nullptr);
}

TEST_CASE("zip archive marks compressed entries unmappable") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string path = dir.file("deflated.zip");

  zip_builder builder;
  builder.add("lib/x86_64/libprov.so", {0x78, 0x9c, 0x01}, r3lr0::archive::kMethodDeflated);
  REQUIRE(r3lr0::test::write_file(path, builder.build()));

  auto opened = zip_archive::open(path);
  REQUIRE(opened.ok());
  const auto* entry = opened.value.find("lib/x86_64/libprov.so");
  REQUIRE(entry != nullptr);
  CHECK_FALSE(entry->mappable());
}

TEST_CASE("zip archive rejects garbage and missing files") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  REQUIRE(r3lr0::test::write_file(dir.file("junk.zip"), std::string(512, 'x')));
  REQUIRE(r3lr0::test::write_file(dir.file("tiny.zip"), std::string("PK")));

  CHECK(zip_archive::open(dir.file("junk.zip")).status.code == r3lr0::error_code::io_error);
  CHECK_FALSE(zip_archive::open(dir.file("tiny.zip")).ok());
  CHECK_FALSE(zip_archive::open(dir.file("absent.zip")).ok());
}

TEST_CASE("zip archive rejects zip64 end records") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  auto bytes = zip_builder().add("a", {1}).build();
  // the directory offset field of the end record
  const size_t end_record = bytes.size() - 22;
  for (size_t i = 16; i < 20; ++i) {
    bytes[end_record + i] = 0xff;
  }
  REQUIRE(r3lr0::test::write_file(dir.file("zip64.zip"), bytes));
  CHECK_FALSE(zip_archive::open(dir.file("zip64.zip")).ok());
}
