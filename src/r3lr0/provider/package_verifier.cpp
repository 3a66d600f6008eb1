#include "r3lr0/provider/package_verifier.hpp"

#include <set>

#include <redlog.hpp>

#include "r3lr0/provider/collaborators.hpp"

namespace r3lr0::provider {

bool signatures_equal(const std::optional<std::vector<std::string>>& a,
                      const std::optional<std::vector<std::string>>& b) {
  if (!a) {
    return !b;
  }
  if (!b) {
    return false;
  }
  const std::set<std::string> left(a->begin(), a->end());
  const std::set<std::string> right(b->begin(), b->end());
  return left == right;
}

status verify_package_info(const package_info& chosen, const package_info& candidate) {
  if (chosen.package_name != candidate.package_name) {
    return make_status(error_code::missing_package,
                       "failed to verify provider, package name mismatch, expected: " + chosen.package_name +
                           " actual: " + candidate.package_name);
  }
  if (chosen.version_code > candidate.version_code) {
    return make_status(error_code::missing_package,
                       "failed to verify provider, version code is lower than expected: " +
                           std::to_string(chosen.version_code) + " actual: " + std::to_string(candidate.version_code));
  }
  if (!provider_library_name(candidate.application)) {
    return make_status(error_code::missing_package, "tried to load an invalid provider: " + candidate.package_name);
  }
  if (!signatures_equal(chosen.signatures, candidate.signatures)) {
    return make_status(error_code::missing_package, "failed to verify provider, signature mismatch");
  }
  return ok_status();
}

status fixup_stub_application_info(application_info& app, package_manager& packages) {
  auto donor_name = app.metadata_value(kDonorMetadataKey);
  if (!donor_name) {
    return ok_status();
  }

  auto donor = packages.get_package_info(*donor_name);
  if (!donor) {
    return make_status(error_code::missing_package, "failed to find donor package: " + *donor_name);
  }

  const application_info& donor_app = donor->application;
  app.source_dir = donor_app.source_dir;
  app.split_source_dirs = donor_app.split_source_dirs;
  app.native_library_dir = donor_app.native_library_dir;
  app.secondary_native_library_dir = donor_app.secondary_native_library_dir;
  // stubs carry no native code, so their abis are unset
  app.primary_cpu_abi = donor_app.primary_cpu_abi;
  app.secondary_cpu_abi = donor_app.secondary_cpu_abi;

  redlog::get_logger("r3lr0.provider")
      .dbg("stub provider uses donor package", redlog::field("donor", *donor_name),
           redlog::field("source_dir", app.source_dir));
  return ok_status();
}

} // namespace r3lr0::provider
