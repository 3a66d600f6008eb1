#include "create_relro.hpp"

#include <iostream>

#include <redlog.hpp>

#include "r3lr0/loader/relro_loader.hpp"
#include "r3lr0/reserve/address_space.hpp"
#include "r3lr0/status.hpp"
#include "tunables.hpp"

namespace r3lr0tool::commands {

int create_relro(
    args::ValueFlag<std::string>& library_flag, args::ValueFlag<std::string>& output_flag,
    args::ValueFlag<uint64_t>& vm_size_flag, args::ValueFlag<std::string>& property_file_flag
) {
  auto log = redlog::get_logger("r3lr0tool.create_relro");

  if (!library_flag || !output_flag) {
    log.err("--library and --output are required");
    return 1;
  }

  const std::string library = args::get(library_flag);
  const std::string output = args::get(output_flag);
  const uint64_t vm_size = requested_reservation_size(vm_size_flag, property_file_flag);

  r3lr0::reserve::address_space_reservation reservation;
  if (!reservation.reserve(vm_size)) {
    log.err("could not reserve address space", redlog::field("bytes", vm_size));
    return 1;
  }

  r3lr0::loader::relro_loader loader(reservation);
  const r3lr0::load_status status = loader.create_relro_file(library, output);

  std::cout << "library:     " << library << "\n";
  std::cout << "snapshot:    " << output << "\n";
  std::cout << "reservation: 0x" << std::hex << reservation.address() << std::dec << " (" << reservation.size()
            << " bytes)\n";
  std::cout << "status:      " << r3lr0::to_string(status) << " (" << r3lr0::to_int(status) << ")\n";

  // readers only match this snapshot when their reservation lands on the same address
  log.vrb("snapshot bound to reservation address", redlog::field("address", "0x%llx",
                                                                 static_cast<unsigned long long>(reservation.address())));
  return status == r3lr0::load_status::success ? 0 : 1;
}

} // namespace r3lr0tool::commands
