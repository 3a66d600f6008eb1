#pragma once

#include <cstdint>
#include <string>

#include <args.hxx>

namespace r3lr0tool::commands {

int vmsize(
    args::ValueFlag<std::string>& property_file_flag, args::ValueFlag<uint64_t>& set_flag,
    args::ValueFlag<std::string>& library32_flag, args::ValueFlag<std::string>& library64_flag, args::Flag& store_flag
);

} // namespace r3lr0tool::commands
