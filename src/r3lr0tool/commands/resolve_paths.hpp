#pragma once

#include <string>

#include <args.hxx>

namespace r3lr0tool::commands {

int resolve_paths(
    args::ValueFlag<std::string>& source_flag, args::ValueFlag<std::string>& primary_abi_flag,
    args::ValueFlag<std::string>& secondary_abi_flag, args::ValueFlag<std::string>& primary_dir_flag,
    args::ValueFlag<std::string>& secondary_dir_flag, args::ValueFlag<std::string>& file_name_flag
);

} // namespace r3lr0tool::commands
