#include <doctest/doctest.h>

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

#include "r3lr0/provider/package_verifier.hpp"
#include "support/package_fixtures.hpp"
#include "support/provider_fakes.hpp"

using namespace r3lr0::provider;

namespace {

std::optional<std::vector<std::string>> sigs(std::initializer_list<std::string> values) {
  return std::vector<std::string>(values);
}

} // namespace

TEST_CASE("signature sets compare without order") {
  CHECK(signatures_equal(sigs({"a", "b"}), sigs({"b", "a"})));
  CHECK(signatures_equal(sigs({"a", "a", "b"}), sigs({"b", "a"})));
  CHECK_FALSE(signatures_equal(sigs({"a"}), sigs({"a", "b"})));
  CHECK(signatures_equal(std::nullopt, std::nullopt));
  CHECK_FALSE(signatures_equal(std::nullopt, sigs({})));
  CHECK_FALSE(signatures_equal(sigs({}), std::nullopt));
}

TEST_CASE("package verification accepts the chosen package and upgrades") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const auto chosen = r3lr0::test::make_package(dir, "com.example.provider", 500);

  CHECK(verify_package_info(chosen, chosen).ok());

  auto newer = chosen;
  newer.version_code = 600;
  CHECK(verify_package_info(chosen, newer).ok());
}

TEST_CASE("package verification rejects integrity failures") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  const auto chosen = r3lr0::test::make_package(dir, "com.example.provider", 500);

  SUBCASE("other package") {
    auto candidate = chosen;
    candidate.package_name = "com.example.other";
    auto s = verify_package_info(chosen, candidate);
    CHECK(s.code == r3lr0::error_code::missing_package);
    CHECK(s.message.find("package name mismatch") != std::string::npos);
  }
  SUBCASE("downgrade") {
    auto candidate = chosen;
    candidate.version_code = 499;
    CHECK(verify_package_info(chosen, candidate).code == r3lr0::error_code::missing_package);
  }
  SUBCASE("no library metadata") {
    auto candidate = chosen;
    candidate.application.metadata.clear();
    CHECK(verify_package_info(chosen, candidate).code == r3lr0::error_code::missing_package);
  }
  SUBCASE("different signer") {
    auto candidate = chosen;
    candidate.signatures = std::vector<std::string>{"sig-a", "sig-c"};
    CHECK(verify_package_info(chosen, candidate).code == r3lr0::error_code::missing_package);
  }
  SUBCASE("unsigned candidate") {
    auto candidate = chosen;
    candidate.signatures.reset();
    CHECK(verify_package_info(chosen, candidate).code == r3lr0::error_code::missing_package);
  }
}

TEST_CASE("stub packages borrow the donor's code locations") {
  r3lr0::test::temp_dir dir;
  REQUIRE(dir.ok());
  r3lr0::test::fake_package_manager packages;

  auto donor = r3lr0::test::make_package(dir, "com.example.donor", 10);
  donor.application.secondary_native_library_dir = dir.file("donor/lib32");
  donor.application.secondary_cpu_abi = "x86";
  donor.application.split_source_dirs = {dir.file("donor/split.apk")};
  packages.install(donor);

  application_info stub;
  stub.source_dir = dir.file("stub/base.apk");
  stub.metadata[kDonorMetadataKey] = "com.example.donor";
  stub.metadata[kLibraryMetadataKey] = "libprov.so";

  REQUIRE(fixup_stub_application_info(stub, packages).ok());
  CHECK(stub.source_dir == donor.application.source_dir);
  CHECK(stub.native_library_dir == donor.application.native_library_dir);
  CHECK(stub.secondary_native_library_dir == dir.file("donor/lib32"));
  CHECK(stub.primary_cpu_abi == donor.application.primary_cpu_abi);
  CHECK(stub.secondary_cpu_abi == "x86");
  CHECK(stub.split_source_dirs.size() == 1);
  CHECK(stub.metadata_value(kLibraryMetadataKey) == std::optional<std::string>("libprov.so"));
}

TEST_CASE("stub without its donor is a missing package") {
  r3lr0::test::fake_package_manager packages;
  application_info stub;
  stub.metadata[kDonorMetadataKey] = "com.example.gone";
  CHECK(fixup_stub_application_info(stub, packages).code == r3lr0::error_code::missing_package);

  application_info regular;
  regular.source_dir = "/data/app/base.apk";
  CHECK(fixup_stub_application_info(regular, packages).ok());
  CHECK(regular.source_dir == "/data/app/base.apk");
  CHECK(packages.lookups.size() == 1);
}
