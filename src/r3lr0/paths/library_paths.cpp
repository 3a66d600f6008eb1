#include "r3lr0/paths/library_paths.hpp"

#include <cstring>

#include <redlog.hpp>

#include "r3lbase/file_utils.hpp"
#include "r3lr0/archive/zip_archive.hpp"

namespace r3lr0::paths {
namespace {

redlog::logger& paths_log() {
  static redlog::logger log = redlog::get_logger("r3lr0.paths");
  return log;
}

// fills one slot: extracted file first, then the owning archive
status resolve_slot(std::string& slot, const library_descriptor& descriptor, const std::vector<std::string>& abis) {
  if (slot.empty()) {
    return ok_status();
  }

  slot += "/" + descriptor.library_file_name;
  if (util::path_exists(slot)) {
    return ok_status();
  }

  paths_log().dbg("library not extracted, searching archive", redlog::field("path", slot),
                  redlog::field("archive", descriptor.source_path));
  auto in_archive = resolve_in_archive(descriptor.source_path, abis, descriptor.library_file_name);
  if (!in_archive.ok()) {
    return in_archive.status;
  }
  slot = in_archive.value;
  return ok_status();
}

} // namespace

std::optional<archive_path> split_archive_path(const std::string& path) {
  const size_t separator = path.find(kArchiveSeparator);
  if (separator == std::string::npos || separator == 0) {
    return std::nullopt;
  }
  archive_path split;
  split.archive = path.substr(0, separator);
  split.entry = path.substr(separator + std::strlen(kArchiveSeparator));
  if (split.entry.empty() || split.entry.find(kArchiveSeparator) != std::string::npos) {
    return std::nullopt;
  }
  return split;
}

std::string format_archive_path(const std::string& archive, const std::string& entry) {
  return archive + kArchiveSeparator + entry;
}

result<std::string> resolve_in_archive(
    const std::string& archive, const std::vector<std::string>& abis, const std::string& file_name
) {
  auto opened = archive::zip_archive::open(archive);
  if (!opened.ok()) {
    return error_result<std::string>(error_code::missing_package, opened.status.message);
  }

  for (const auto& abi : abis) {
    const std::string entry_name = "lib/" + abi + "/" + file_name;
    const auto* entry = opened.value.find(entry_name);
    if (!entry) {
      continue;
    }
    if (!entry->mappable()) {
      paths_log().wrn("skipping compressed library entry", redlog::field("archive", archive),
                      redlog::field("entry", entry_name), redlog::field("method", entry->method));
      continue;
    }
    paths_log().vrb("found stored library in archive", redlog::field("archive", archive),
                    redlog::field("entry", entry_name));
    return ok_result(format_archive_path(archive, entry_name));
  }

  paths_log().dbg("no mappable library entry in archive", redlog::field("archive", archive),
                  redlog::field("file", file_name));
  return ok_result(std::string());
}

result<resolved_library_paths> resolve_paths(const library_descriptor& descriptor, const abi_table& abis) {
  if (descriptor.library_file_name.empty()) {
    return error_result<resolved_library_paths>(error_code::missing_package, "package names no native library");
  }

  resolved_library_paths paths;

  const bool primary_is_64 = abi_table::is_64bit(descriptor.primary_abi);
  if (!descriptor.secondary_abi.empty()) {
    // multi-arch: the secondary dir belongs to the other width
    if (primary_is_64) {
      paths.path64 = descriptor.primary_lib_dir;
      paths.path32 = descriptor.secondary_lib_dir;
    } else {
      paths.path64 = descriptor.secondary_lib_dir;
      paths.path32 = descriptor.primary_lib_dir;
    }
  } else if (primary_is_64) {
    paths.path64 = descriptor.primary_lib_dir;
  } else {
    paths.path32 = descriptor.primary_lib_dir;
  }

  if (auto s = resolve_slot(paths.path32, descriptor, abis.supported_32); !s.ok()) {
    return error_result<resolved_library_paths>(std::move(s));
  }
  if (auto s = resolve_slot(paths.path64, descriptor, abis.supported_64); !s.ok()) {
    return error_result<resolved_library_paths>(std::move(s));
  }

  paths_log().vrb("resolved native library paths", redlog::field("path32", paths.path32),
                  redlog::field("path64", paths.path64));
  return ok_result(std::move(paths));
}

std::optional<uint64_t> library_file_size(const std::string& path) {
  if (path.empty()) {
    return std::nullopt;
  }
  if (auto size = util::file_size(path)) {
    return size;
  }

  auto split = split_archive_path(path);
  if (!split) {
    return std::nullopt;
  }
  auto opened = archive::zip_archive::open(split->archive);
  if (!opened.ok()) {
    return std::nullopt;
  }
  const auto* entry = opened.value.find(split->entry);
  if (!entry || !entry->mappable()) {
    return std::nullopt;
  }
  return entry->uncompressed_size;
}

} // namespace r3lr0::paths
