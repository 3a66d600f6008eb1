#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace r3lr0tool::commands {

// --property-file, else the configured store
std::string property_file_path(args::ValueFlag<std::string>& property_file_flag);

// --vm-size, else the stored tunable, else the default
uint64_t requested_reservation_size(
    args::ValueFlag<uint64_t>& vm_size_flag, args::ValueFlag<std::string>& property_file_flag
);

// lists the stored tunables and the reservation a bootstrap would request
int tunables(args::ValueFlag<std::string>& property_file_flag, args::ValueFlag<uint64_t>& vm_size_flag);

} // namespace r3lr0tool::commands
