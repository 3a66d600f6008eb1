#include <doctest/doctest.h>

#include <chrono>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

#include <sys/stat.h>

#include "r3lbase/file_utils.hpp"
#include "r3lbase/page_utils.hpp"
#include "r3lr0/abi.hpp"
#include "r3lr0/loader/link_namespace.hpp"
#include "r3lr0/loader/relro_loader.hpp"
#include "r3lr0/provider/relro_writer.hpp"
#include "r3lr0/relro/snapshot.hpp"
#include "r3lr0/reserve/address_space.hpp"
#include "support/test_support.hpp"

using r3lr0::load_status;
using r3lr0::sharing_status;
using r3lr0::loader::relro_loader;
using r3lr0::reserve::address_space_reservation;
using r3lr0::test::run_in_child;

namespace {

constexpr uint64_t kTestReservation = 16 << 20;

const std::string kFixtureV5 = R3LR0_FIXTURE_V5_PATH;
const std::string kFixtureV6 = R3LR0_FIXTURE_V6_PATH;
const std::string kFixtureBadAbi = R3LR0_FIXTURE_BAD_ABI_PATH;

using version_fn = int (*)();
using count_fn = int (*)();

bool is_64() { return r3lr0::native_width() == r3lr0::elf_width::bits64; }

// passes lib and relro in the slot of the running process's width
load_status load_native(relro_loader& loader, const std::string& lib, const std::string& relro) {
  return is_64() ? loader.load_with_sharing("", lib, "", relro) : loader.load_with_sharing(lib, "", relro, "");
}

int loaded_version(const relro_loader& loader) {
  const auto* library = loader.library();
  if (!library) {
    return -1;
  }
  auto version = library->find_function<version_fn>("r3lr0_fixture_version");
  return version ? version() : -1;
}

} // namespace

TEST_CASE("reader shares relro pages written by a forked writer") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string snapshot = dir.file("libprovider.relro");

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    if (!reservation.reserve(kTestReservation)) {
      return 1;
    }
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::seconds(30));
    if (writer.prepare(r3lr0::native_width(), kFixtureV5, snapshot) != load_status::success) {
      return 2;
    }

    relro_loader loader(reservation);
    if (load_native(loader, kFixtureV5, snapshot) != load_status::success) {
      return 3;
    }
    if (loader.last_sharing_status() != sharing_status::shared) {
      return 4;
    }
    const auto* library = loader.library();
    if (library->load_address() != reservation.address() || !library->in_reservation()) {
      return 5;
    }
    if (library->relro_size() == 0 || !r3lr0::test::mapped_from_file(library->relro_start(), "libprovider.relro")) {
      return 6;
    }
    if (loaded_version(loader) != 5) {
      return 7;
    }
    // relocated pointers in the shared pages still resolve
    auto twice = library->find_function<version_fn>("r3lr0_fixture_twice_version");
    if (!twice || twice() != 10) {
      return 8;
    }
    auto inits = library->find_function<count_fn>("r3lr0_fixture_init_count");
    if (!inits || inits() != 1) {
      return 9;
    }
    return 0;
  });
  CHECK(code == 0);
}

TEST_CASE("snapshot of another version falls back to private relocation") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string snapshot = dir.file("libprovider.relro");

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    if (!reservation.reserve(kTestReservation)) {
      return 1;
    }
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::seconds(30));
    if (writer.prepare(r3lr0::native_width(), kFixtureV5, snapshot) != load_status::success) {
      return 2;
    }

    relro_loader loader(reservation);
    if (load_native(loader, kFixtureV6, snapshot) != load_status::success) {
      return 3;
    }
    if (loader.last_sharing_status() != sharing_status::snapshot_mismatch) {
      return 4;
    }
    if (r3lr0::test::mapped_from_file(loader.library()->relro_start(), "libprovider.relro")) {
      return 5;
    }
    return loaded_version(loader) == 6 ? 0 : 6;
  });
  CHECK(code == 0);
}

TEST_CASE("rewriting the snapshot for a new version restores sharing") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string snapshot = dir.file("libprovider.relro");

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    if (!reservation.reserve(kTestReservation)) {
      return 1;
    }
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::seconds(30));
    if (writer.prepare(r3lr0::native_width(), kFixtureV5, snapshot) != load_status::success ||
        writer.prepare(r3lr0::native_width(), kFixtureV6, snapshot) != load_status::success) {
      return 2;
    }

    relro_loader loader(reservation);
    if (load_native(loader, kFixtureV6, snapshot) != load_status::success) {
      return 3;
    }
    return loader.last_sharing_status() == sharing_status::shared ? 0 : 4;
  });
  CHECK(code == 0);
}

TEST_CASE("missing and empty snapshots keep the private relocation") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  REQUIRE(r3lr0::test::write_file(dir.file("empty.relro"), std::vector<uint8_t>{}));

  SUBCASE("missing") {
    const int code = run_in_child([&] {
      address_space_reservation reservation;
      reservation.reserve(kTestReservation);
      relro_loader loader(reservation);
      if (load_native(loader, kFixtureV5, dir.file("absent.relro")) != load_status::success) {
        return 1;
      }
      return loader.last_sharing_status() == sharing_status::snapshot_missing ? 0 : 2;
    });
    CHECK(code == 0);
  }

  SUBCASE("empty") {
    const int code = run_in_child([&] {
      address_space_reservation reservation;
      reservation.reserve(kTestReservation);
      relro_loader loader(reservation);
      if (load_native(loader, kFixtureV5, dir.file("empty.relro")) != load_status::success) {
        return 1;
      }
      return loader.last_sharing_status() == sharing_status::snapshot_mismatch ? 0 : 2;
    });
    CHECK(code == 0);
  }
}

TEST_CASE("damaged snapshots keep the private relocation") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string snapshot = dir.file("libprovider.relro");

  enum class damage { header_byte, truncated_payload, every_payload_page };
  damage kind = damage::header_byte;
  SUBCASE("flipped header byte") { kind = damage::header_byte; }
  SUBCASE("truncated payload") { kind = damage::truncated_payload; }
  SUBCASE("every payload page differs") { kind = damage::every_payload_page; }

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    if (!reservation.reserve(kTestReservation)) {
      return 1;
    }
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::seconds(30));
    if (writer.prepare(r3lr0::native_width(), kFixtureV5, snapshot) != load_status::success) {
      return 2;
    }

    auto bytes = r3lr0::test::read_file(snapshot);
    r3lr0::relro::snapshot_header header{};
    if (bytes.size() < sizeof(header)) {
      return 3;
    }
    std::memcpy(&header, bytes.data(), sizeof(header));
    if (bytes.size() != header.payload_offset + header.relro_size) {
      return 4;
    }

    switch (kind) {
    case damage::header_byte:
      bytes[offsetof(r3lr0::relro::snapshot_header, load_address)] ^= 0x10;
      break;
    case damage::truncated_payload:
      bytes.resize(bytes.size() - 1);
      break;
    case damage::every_payload_page:
      for (uint64_t at = header.payload_offset; at < bytes.size(); at += r3lr0::util::page_size()) {
        bytes[at] ^= 0xff;
      }
      break;
    }
    if (!r3lr0::test::write_file(snapshot, bytes)) {
      return 5;
    }

    relro_loader loader(reservation);
    if (load_native(loader, kFixtureV5, snapshot) != load_status::success) {
      return 6;
    }
    if (loader.last_sharing_status() != sharing_status::snapshot_mismatch) {
      return 7;
    }
    if (r3lr0::test::mapped_from_file(loader.library()->relro_start(), "libprovider.relro")) {
      return 8;
    }
    return loaded_version(loader) == 5 ? 0 : 9;
  });
  CHECK(code == 0);
}

TEST_CASE("writer process cannot load a library afterwards") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string snapshot = dir.file("libprovider.relro");

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    relro_loader loader(reservation);
    if (loader.create_relro_file(kFixtureV5, snapshot) != load_status::success) {
      return 1;
    }
    if (loader.last_sharing_status() != sharing_status::written) {
      return 2;
    }
    if (load_native(loader, kFixtureV5, snapshot) != load_status::failed_to_load_library) {
      return 3;
    }
    return loader.create_relro_file(kFixtureV5, snapshot) == load_status::failed_to_load_library ? 0 : 4;
  });
  CHECK(code == 0);
  CHECK(r3lr0::util::path_exists(snapshot));
}

TEST_CASE("unwritable snapshot location is reported") {
  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    relro_loader loader(reservation);
    return r3lr0::to_int(loader.create_relro_file(kFixtureV5, "/nonexistent-dir/r3lr0/lib.relro"));
  });
  CHECK(code == r3lr0::to_int(load_status::failed_to_open_relro_file));
}

TEST_CASE("one provider library per process") {
  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    relro_loader loader(reservation);
    if (load_native(loader, kFixtureV5, "") != load_status::success) {
      return 1;
    }
    const auto* first = loader.library();
    if (load_native(loader, kFixtureV5, "") != load_status::success || loader.library() != first) {
      return 2;
    }
    if (load_native(loader, kFixtureV6, "") != load_status::failed_to_load_library) {
      return 3;
    }
    auto inits = first->find_function<count_fn>("r3lr0_fixture_init_count");
    return inits && inits() == 1 ? 0 : 4;
  });
  CHECK(code == 0);
}

TEST_CASE("the width of this process must have a library") {
  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    relro_loader loader(reservation);

    // only the other width is present
    const load_status missing = is_64() ? loader.load_with_sharing(kFixtureV5, "", "", "")
                                        : loader.load_with_sharing("", kFixtureV5, "", "");
    if (missing != load_status::failed_to_load_library) {
      return 1;
    }
    // a broken library for the other width is ignored
    const load_status loaded = is_64() ? loader.load_with_sharing("/nonexistent/lib32.so", kFixtureV5, "", "")
                                       : loader.load_with_sharing(kFixtureV5, "/nonexistent/lib64.so", "", "");
    return loaded == load_status::success ? 0 : 2;
  });
  CHECK(code == 0);
}

TEST_CASE("rejected load hook poisons the loader") {
  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    relro_loader loader(reservation);
    if (load_native(loader, kFixtureBadAbi, "") != load_status::failed_on_load_hook) {
      return 1;
    }
    if (loader.library() != nullptr) {
      return 2;
    }
    return load_native(loader, kFixtureV5, "") == load_status::failed_to_load_library ? 0 : 3;
  });
  CHECK(code == 0);
}

TEST_CASE("invalid libraries leave the reservation usable") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  REQUIRE(r3lr0::test::write_file(dir.file("libjunk.so"), std::string(4096, 'j')));

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    relro_loader loader(reservation);
    if (load_native(loader, dir.file("libjunk.so"), "") != load_status::failed_to_load_library) {
      return 1;
    }
    if (load_native(loader, dir.file("libabsent.so"), "") != load_status::failed_to_load_library) {
      return 2;
    }
    return load_native(loader, kFixtureV5, "") == load_status::success ? 0 : 3;
  });
  CHECK(code == 0);
}

TEST_CASE("library larger than the reservation is refused") {
  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(r3lr0::util::page_size());
    relro_loader loader(reservation);
    return r3lr0::to_int(load_native(loader, kFixtureV5, ""));
  });
  CHECK(code == r3lr0::to_int(load_status::failed_to_load_library));
}

TEST_CASE("private load maps outside the reservation") {
  const int code = run_in_child([&] {
    address_space_reservation reservation;
    relro_loader loader(reservation);
    if (loader.load_private(kFixtureV5) != load_status::success) {
      return 1;
    }
    const auto* library = loader.library();
    if (library->in_reservation() || loader.last_sharing_status() != sharing_status::not_attempted) {
      return 2;
    }
    return loaded_version(loader) == 5 ? 0 : 3;
  });
  CHECK(code == 0);
}

TEST_CASE("link namespaces must be registered") {
  SUBCASE("unknown namespace") {
    const int code = run_in_child([&] {
      address_space_reservation reservation;
      reservation.reserve(kTestReservation);
      relro_loader loader(reservation);
      loader.set_link_namespace("provider");
      return r3lr0::to_int(load_native(loader, kFixtureV5, ""));
    });
    CHECK(code == r3lr0::to_int(load_status::failed_to_find_namespace));
  }

  SUBCASE("registered namespace") {
    const int code = run_in_child([&] {
      r3lr0::loader::namespace_registry namespaces;
      if (!namespaces.add({"provider", {"/nonexistent/lib"}}) || namespaces.add({"provider", {}})) {
        return 1;
      }
      address_space_reservation reservation;
      reservation.reserve(kTestReservation);
      relro_loader loader(reservation, &namespaces);
      loader.set_link_namespace("provider");
      return r3lr0::to_int(load_native(loader, kFixtureV5, ""));
    });
    CHECK(code == 0);
  }
}

TEST_CASE("library stored in an archive is loaded and shared") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const std::string apk = dir.file("base.apk");
  const std::string snapshot = dir.file("libprovider.relro");
  const std::string entry = "lib/test/libprovider.so";

  const auto library_bytes = r3lr0::test::read_file(kFixtureV5);
  REQUIRE_FALSE(library_bytes.empty());
  r3lr0::test::zip_builder builder;
  builder.add("classes.dex", {1, 2, 3}).add(entry, library_bytes, 0, static_cast<uint32_t>(r3lr0::util::page_size()));
  REQUIRE(r3lr0::test::write_file(apk, builder.build()));
  const std::string path = apk + "!/" + entry;

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::seconds(30));
    if (writer.prepare(r3lr0::native_width(), path, snapshot) != load_status::success) {
      return 1;
    }
    relro_loader loader(reservation);
    if (load_native(loader, path, snapshot) != load_status::success) {
      return 2;
    }
    if (loader.last_sharing_status() != sharing_status::shared) {
      return 3;
    }
    return loaded_version(loader) == 5 ? 0 : 4;
  });
  CHECK(code == 0);
}

TEST_CASE("forked writer reports the child's status") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    reservation.reserve(kTestReservation);
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::seconds(30));
    const auto other = is_64() ? r3lr0::elf_width::bits32 : r3lr0::elf_width::bits64;
    if (writer.can_serve(other) || !writer.can_serve(r3lr0::native_width())) {
      return 1;
    }
    return r3lr0::to_int(writer.prepare(r3lr0::native_width(), dir.file("libabsent.so"), dir.file("x.relro")));
  });
  CHECK(code == r3lr0::to_int(load_status::failed_to_load_library));

  address_space_reservation unreserved;
  r3lr0::provider::forked_relro_writer idle_writer(unreserved, std::chrono::seconds(1));
  CHECK(idle_writer.prepare(r3lr0::native_width(), kFixtureV5, dir.file("y.relro")) ==
        load_status::address_space_not_reserved);
}

TEST_CASE("writer killed on timeout leaves no staged snapshot") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  // opening a fifo with no writer blocks, so the child never finishes
  const std::string library = dir.file("libstuck.so");
  REQUIRE(::mkfifo(library.c_str(), 0600) == 0);
  const std::string snapshot = dir.file("stuck.relro");
  REQUIRE(r3lr0::test::write_file(r3lr0::relro::staging_path(snapshot), std::string("partial")));

  const int code = run_in_child([&] {
    address_space_reservation reservation;
    if (!reservation.reserve(kTestReservation)) {
      return 1;
    }
    r3lr0::provider::forked_relro_writer writer(reservation, std::chrono::milliseconds(200));
    if (writer.prepare(r3lr0::native_width(), library, snapshot) != load_status::failed_waiting_for_relro) {
      return 2;
    }
    return 0;
  });
  CHECK(code == 0);
  CHECK_FALSE(r3lr0::util::path_exists(r3lr0::relro::staging_path(snapshot)));
  CHECK_FALSE(r3lr0::util::path_exists(snapshot));
}
