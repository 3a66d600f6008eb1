#pragma once

#include <cstdint>
#include <string>

#include "r3lbase/file_utils.hpp"
#include "r3lr0/result.hpp"

namespace r3lr0::loader {

// open ELF bytes: a plain file or a STORED, page-aligned archive entry
struct image_source {
  std::string path;
  util::unique_fd fd;
  uint64_t offset = 0;
  uint64_t size = 0;
};

result<image_source> open_image_source(const std::string& path);

} // namespace r3lr0::loader
