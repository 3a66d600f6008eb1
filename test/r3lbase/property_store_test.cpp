#include <doctest/doctest.h>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/property_store.hpp"
#include "support/test_support.hpp"

TEST_CASE("property store reads absent keys as defaults") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  r3lr0::util::property_store store(dir.file("props"));
  CHECK_FALSE(store.get("persist.missing").has_value());
  CHECK(store.get_u64("persist.missing", 42) == 42);
}

TEST_CASE("property store persists values across instances") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string path = dir.file("props");

  {
    r3lr0::util::property_store store(path);
    CHECK(store.set_u64("persist.r3lr0.vmsize", 209715200));
    CHECK(store.set("other.key", "value"));
  }

  r3lr0::util::property_store reopened(path);
  CHECK(reopened.get_u64("persist.r3lr0.vmsize", 0) == 209715200);
  REQUIRE(reopened.get("other.key").has_value());
  CHECK(*reopened.get("other.key") == "value");
  CHECK_FALSE(r3lr0::util::path_exists(path + ".tmp"));
}

TEST_CASE("property store overwrites a key in place") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  r3lr0::util::property_store store(dir.file("props"));
  CHECK(store.set_u64("k", 1));
  CHECK(store.set_u64("k", 2));
  CHECK(store.get_u64("k", 0) == 2);
}

TEST_CASE("property store skips comments and malformed lines") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string path = dir.file("props");
  REQUIRE(r3lr0::test::write_file(path, std::string("# tunables\n\n  spaced = 12 \nno separator\n=orphan\nhex=0x10\n")));

  r3lr0::util::property_store store(path);
  CHECK(store.get_u64("spaced", 0) == 12);
  CHECK(store.get_u64("hex", 0) == 16);
  CHECK_FALSE(store.get("no separator").has_value());
}

TEST_CASE("property store falls back on non numeric values") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  r3lr0::util::property_store store(dir.file("props"));
  CHECK(store.set("persist.r3lr0.vmsize", "lots"));
  CHECK(store.get_u64("persist.r3lr0.vmsize", 7) == 7);
  CHECK(store.set("persist.r3lr0.vmsize", "12abc"));
  CHECK(store.get_u64("persist.r3lr0.vmsize", 7) == 7);
}

TEST_CASE("property store rejects negative sizes instead of wrapping them") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  r3lr0::util::property_store store(dir.file("props"));
  CHECK(store.set("persist.r3lr0.vmsize", "-1"));
  CHECK(store.get_u64("persist.r3lr0.vmsize", 104857600) == 104857600);
  CHECK(store.set("persist.r3lr0.vmsize", "-0x10"));
  CHECK(store.get_u64("persist.r3lr0.vmsize", 104857600) == 104857600);
}

TEST_CASE("property store lists every stored pair") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  r3lr0::util::property_store store(dir.file("props"));
  CHECK(store.entries().empty());
  CHECK(store.set_u64("persist.r3lr0.vmsize", 209715200));
  CHECK(store.set("a.key", "x"));

  const auto entries = store.entries();
  REQUIRE(entries.size() == 2);
  CHECK(entries.begin()->first == "a.key");
  CHECK(entries.at("persist.r3lr0.vmsize") == "209715200");
}

TEST_CASE("property store reports unwritable locations") {
  r3lr0::util::property_store store("/nonexistent-dir/r3lr0/props");
  CHECK_FALSE(store.set_u64("k", 1));
}
