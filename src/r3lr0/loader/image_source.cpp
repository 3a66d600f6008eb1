#include "r3lr0/loader/image_source.hpp"

#include <redlog.hpp>

#include "r3lbase/page_utils.hpp"
#include "r3lr0/archive/zip_archive.hpp"
#include "r3lr0/paths/library_paths.hpp"

namespace r3lr0::loader {

result<image_source> open_image_source(const std::string& path) {
  auto log = redlog::get_logger("r3lr0.loader");

  image_source source;
  source.path = path;

  auto split = paths::split_archive_path(path);
  if (!split) {
    source.fd = util::open_read_only(path);
    if (!source.fd) {
      return error_result<image_source>(error_code::io_error, "failed to open " + path + ": " + util::errno_text());
    }
    auto size = util::file_size(source.fd.get());
    if (!size) {
      return error_result<image_source>(error_code::io_error, "failed to stat " + path);
    }
    source.size = *size;
    return ok_result(std::move(source));
  }

  auto archive = archive::zip_archive::open(split->archive);
  if (!archive.ok()) {
    return error_result<image_source>(archive.status);
  }
  const auto* entry = archive.value.find(split->entry);
  if (!entry) {
    return error_result<image_source>(error_code::io_error, "no entry " + split->entry + " in " + split->archive);
  }
  if (!entry->mappable()) {
    return error_result<image_source>(error_code::load_failed, "entry " + split->entry + " is not stored");
  }
  auto offset = archive.value.data_offset(*entry);
  if (!offset) {
    return error_result<image_source>(error_code::io_error, "bad local header for " + split->entry);
  }
  if (!util::is_page_aligned(*offset)) {
    return error_result<image_source>(error_code::load_failed,
                                      "entry " + split->entry + " is not page aligned in " + split->archive);
  }

  source.fd = util::open_read_only(split->archive);
  if (!source.fd) {
    return error_result<image_source>(error_code::io_error, "failed to open " + split->archive);
  }
  source.offset = *offset;
  source.size = entry->uncompressed_size;
  log.vrb("mapping library from archive", redlog::field("archive", split->archive),
          redlog::field("entry", split->entry), redlog::field("offset", "0x%llx", static_cast<unsigned long long>(*offset)));
  return ok_result(std::move(source));
}

} // namespace r3lr0::loader
