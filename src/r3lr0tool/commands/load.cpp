#include "load.hpp"

#include <iostream>

#include <redlog.hpp>

#include "r3lr0/abi.hpp"
#include "r3lr0/config.hpp"
#include "r3lr0/loader/relro_loader.hpp"
#include "r3lr0/provider/relro_writer.hpp"
#include "r3lr0/reserve/address_space.hpp"
#include "r3lr0/status.hpp"
#include "tunables.hpp"

namespace r3lr0tool::commands {

int load(
    args::ValueFlag<std::string>& library_flag, args::ValueFlag<std::string>& relro_flag,
    args::ValueFlag<uint64_t>& vm_size_flag, args::ValueFlag<std::string>& property_file_flag,
    args::Flag& write_first_flag, args::Flag& no_reserve_flag, args::ValueFlagList<std::string>& symbols_flag
) {
  auto log = redlog::get_logger("r3lr0tool.load");

  if (!library_flag) {
    log.err("--library is required");
    return 1;
  }

  const auto cfg = r3lr0::config::from_environment();
  const bool is_64 = r3lr0::native_width() == r3lr0::elf_width::bits64;
  const std::string library = args::get(library_flag);
  const std::string relro = relro_flag ? args::get(relro_flag) : (is_64 ? cfg.relro_64_path() : cfg.relro_32_path());

  r3lr0::reserve::address_space_reservation reservation;
  if (!no_reserve_flag) {
    reservation.reserve(requested_reservation_size(vm_size_flag, property_file_flag));
  }

  if (write_first_flag) {
    if (!reservation.reserved()) {
      log.err("--write-first needs a reservation");
      return 1;
    }
    r3lr0::provider::forked_relro_writer writer(reservation, cfg.writer_timeout);
    const auto written = writer.prepare(r3lr0::native_width(), library, relro);
    std::cout << "writer:      " << r3lr0::to_string(written) << " (" << r3lr0::to_int(written) << ")\n";
  }

  r3lr0::loader::relro_loader loader(reservation);
  r3lr0::load_status status = is_64 ? loader.load_with_sharing("", library, "", relro)
                                    : loader.load_with_sharing(library, "", relro, "");
  if (status == r3lr0::load_status::address_space_not_reserved) {
    log.wrn("no reservation, loading privately");
    status = loader.load_private(library);
  }

  std::cout << "library:     " << library << "\n";
  std::cout << "status:      " << r3lr0::to_string(status) << " (" << r3lr0::to_int(status) << ")\n";
  std::cout << "sharing:     " << r3lr0::to_string(loader.last_sharing_status()) << "\n";

  const auto* loaded = loader.library();
  if (status != r3lr0::load_status::success || !loaded) {
    return 1;
  }

  std::cout << std::hex;
  std::cout << "address:     0x" << loaded->load_address() << " (+0x" << loaded->load_size() << ")\n";
  std::cout << "relro:       0x" << loaded->relro_start() << " (+0x" << loaded->relro_size() << ")\n";
  std::cout << std::dec;
  std::cout << "reserved:    " << (loaded->in_reservation() ? "yes" : "no") << "\n";

  int missing = 0;
  for (const auto& name : args::get(symbols_flag)) {
    void* symbol = loaded->find_symbol(name);
    if (!symbol) {
      log.wrn("symbol not found", redlog::field("name", name));
      ++missing;
      continue;
    }
    std::cout << "symbol:      " << name << " = " << symbol << "\n";
  }
  return missing == 0 ? 0 : 1;
}

} // namespace r3lr0tool::commands
