#pragma once

#include <chrono>
#include <string>

#include <redlog.hpp>

#include "r3lr0/abi.hpp"
#include "r3lr0/status.hpp"

namespace r3lr0::reserve {
class address_space_reservation;
}

namespace r3lr0::provider {

// produces the relro snapshot of one width for a library
class relro_writer {
public:
  virtual ~relro_writer() = default;

  virtual bool can_serve(elf_width width) const = 0;
  virtual load_status prepare(elf_width width, const std::string& lib_path, const std::string& relro_path) = 0;
};

/**
 * Runs create_relro_file in a child forked from the reserving process, so the
 * child sees the reservation at the address every reader will use.
 *
 * The child exits with the load status; a child still running after the
 * timeout is killed and reported as failed_waiting_for_relro. Forking is only
 * safe from a single-threaded process.
 */
class forked_relro_writer : public relro_writer {
public:
  forked_relro_writer(reserve::address_space_reservation& reservation, std::chrono::milliseconds timeout);

  bool can_serve(elf_width width) const override { return width == native_width(); }
  load_status prepare(elf_width width, const std::string& lib_path, const std::string& relro_path) override;

private:
  reserve::address_space_reservation& reservation_;
  std::chrono::milliseconds timeout_;
  redlog::logger log_;
};

} // namespace r3lr0::provider
