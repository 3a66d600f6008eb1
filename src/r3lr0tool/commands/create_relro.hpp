#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace r3lr0tool::commands {

int create_relro(
    args::ValueFlag<std::string>& library_flag, args::ValueFlag<std::string>& output_flag,
    args::ValueFlag<uint64_t>& vm_size_flag, args::ValueFlag<std::string>& property_file_flag
);

} // namespace r3lr0tool::commands
