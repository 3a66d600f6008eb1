#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace r3lr0tool::commands {

int load(
    args::ValueFlag<std::string>& library_flag, args::ValueFlag<std::string>& relro_flag,
    args::ValueFlag<uint64_t>& vm_size_flag, args::ValueFlag<std::string>& property_file_flag,
    args::Flag& write_first_flag, args::Flag& no_reserve_flag, args::ValueFlagList<std::string>& symbols_flag
);

} // namespace r3lr0tool::commands
