#include "r3lr0/archive/zip_archive.hpp"

#include <algorithm>

#include <redlog.hpp>

namespace r3lr0::archive {
namespace {

constexpr uint32_t kLocalHeaderSignature = 0x04034b50;
constexpr uint32_t kCentralEntrySignature = 0x02014b50;
constexpr uint32_t kEndRecordSignature = 0x06054b50;

constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralEntrySize = 46;
constexpr size_t kEndRecordSize = 22;
constexpr size_t kMaxCommentSize = 0xffff;

uint16_t read_le16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1] << 8)); }

uint32_t read_le32(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

redlog::logger& zip_log() {
  static redlog::logger log = redlog::get_logger("r3lr0.zip");
  return log;
}

} // namespace

result<zip_archive> zip_archive::open(const std::string& path) {
  zip_archive archive;
  archive.path_ = path;
  archive.fd_ = util::open_read_only(path);
  if (!archive.fd_) {
    std::string error = util::errno_text();
    zip_log().err("failed to open archive", redlog::field("path", path), redlog::field("error", error));
    return error_result<zip_archive>(error_code::io_error, "cannot open archive " + path + ": " + error);
  }

  auto size = util::file_size(archive.fd_.get());
  if (!size) {
    return error_result<zip_archive>(error_code::io_error, "cannot stat archive " + path);
  }
  archive.size_ = *size;

  if (!archive.read_central_directory()) {
    return error_result<zip_archive>(error_code::io_error, "malformed archive " + path);
  }

  zip_log().dbg("opened archive", redlog::field("path", path), redlog::field("entries", archive.entries_.size()));
  return ok_result(std::move(archive));
}

bool zip_archive::read_central_directory() {
  if (size_ < kEndRecordSize) {
    zip_log().err("archive too small", redlog::field("path", path_), redlog::field("bytes", size_));
    return false;
  }

  // the end record sits in the last 22 bytes unless an archive comment follows it
  const uint64_t tail_size = std::min<uint64_t>(size_, kEndRecordSize + kMaxCommentSize);
  const uint64_t tail_offset = size_ - tail_size;
  std::vector<uint8_t> tail(static_cast<size_t>(tail_size));
  if (!util::read_fully_at(fd_.get(), tail.data(), tail.size(), tail_offset)) {
    zip_log().err("failed to read archive tail", redlog::field("path", path_));
    return false;
  }

  const uint8_t* end_record = nullptr;
  for (size_t pos = tail.size() - kEndRecordSize + 1; pos-- > 0;) {
    if (read_le32(&tail[pos]) != kEndRecordSignature) {
      continue;
    }
    const uint16_t comment_size = read_le16(&tail[pos + 20]);
    if (pos + kEndRecordSize + comment_size <= tail.size()) {
      end_record = &tail[pos];
      break;
    }
  }
  if (!end_record) {
    zip_log().err("end of central directory not found", redlog::field("path", path_));
    return false;
  }

  const uint16_t entry_count = read_le16(end_record + 10);
  const uint32_t directory_size = read_le32(end_record + 12);
  const uint32_t directory_offset = read_le32(end_record + 16);
  if (entry_count == 0xffff || directory_offset == 0xffffffff || directory_size == 0xffffffff) {
    zip_log().err("zip64 archives are not supported", redlog::field("path", path_));
    return false;
  }
  if (static_cast<uint64_t>(directory_offset) + directory_size > size_) {
    zip_log().err("central directory out of bounds", redlog::field("path", path_));
    return false;
  }

  std::vector<uint8_t> directory(directory_size);
  if (directory_size > 0 && !util::read_fully_at(fd_.get(), directory.data(), directory.size(), directory_offset)) {
    zip_log().err("failed to read central directory", redlog::field("path", path_));
    return false;
  }

  entries_.clear();
  entries_.reserve(entry_count);
  size_t pos = 0;
  for (uint16_t i = 0; i < entry_count; ++i) {
    if (pos + kCentralEntrySize > directory.size() || read_le32(&directory[pos]) != kCentralEntrySignature) {
      zip_log().err("corrupt central directory entry", redlog::field("path", path_), redlog::field("index", i));
      return false;
    }
    const uint8_t* p = &directory[pos];
    const uint16_t name_size = read_le16(p + 28);
    const uint16_t extra_size = read_le16(p + 30);
    const uint16_t comment_size = read_le16(p + 32);
    const size_t record_size = kCentralEntrySize + name_size + extra_size + comment_size;
    if (pos + record_size > directory.size()) {
      zip_log().err("central directory entry overruns directory", redlog::field("path", path_),
                    redlog::field("index", i));
      return false;
    }

    zip_entry entry;
    entry.flags = read_le16(p + 8);
    entry.method = read_le16(p + 10);
    entry.crc32 = read_le32(p + 16);
    entry.compressed_size = read_le32(p + 20);
    entry.uncompressed_size = read_le32(p + 24);
    entry.local_header_offset = read_le32(p + 42);
    entry.name.assign(reinterpret_cast<const char*>(p + kCentralEntrySize), name_size);
    entries_.push_back(std::move(entry));

    pos += record_size;
  }
  return true;
}

const zip_entry* zip_archive::find(std::string_view name) const {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const zip_entry& entry) { return entry.name == name; });
  return it == entries_.end() ? nullptr : &*it;
}

std::optional<uint64_t> zip_archive::data_offset(const zip_entry& entry) const {
  uint8_t header[kLocalHeaderSize];
  if (!util::read_fully_at(fd_.get(), header, sizeof(header), entry.local_header_offset)) {
    zip_log().err("failed to read local header", redlog::field("entry", entry.name));
    return std::nullopt;
  }
  if (read_le32(header) != kLocalHeaderSignature) {
    zip_log().err("bad local header signature", redlog::field("entry", entry.name));
    return std::nullopt;
  }

  const uint64_t offset = entry.local_header_offset + kLocalHeaderSize + read_le16(header + 26) + read_le16(header + 28);
  if (offset > size_ || entry.compressed_size > size_ - offset) {
    zip_log().err("entry data out of bounds", redlog::field("entry", entry.name));
    return std::nullopt;
  }
  return offset;
}

} // namespace r3lr0::archive
