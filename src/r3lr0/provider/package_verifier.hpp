#pragma once

#include <optional>
#include <string>
#include <vector>

#include "r3lr0/provider/package_info.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::provider {

class package_manager;

// unordered comparison; absent only equals absent
bool signatures_equal(const std::optional<std::vector<std::string>>& a,
                      const std::optional<std::vector<std::string>>& b);

/**
 * Checks a freshly fetched package against the one the update service chose.
 *
 * Fails with missing_package when the names differ, the candidate is older
 * than the chosen version, the candidate lacks library metadata, or the
 * signature sets differ. These are integrity failures and are never retried.
 */
status verify_package_info(const package_info& chosen, const package_info& candidate);

// a stub naming a donor package borrows the donor's code locations and abis
status fixup_stub_application_info(application_info& app, package_manager& packages);

} // namespace r3lr0::provider
