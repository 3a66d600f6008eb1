#pragma once

#include <string>

#include <args.hxx>

namespace r3lr0tool::commands {

int inspect_relro(args::ValueFlag<std::string>& file_flag, args::ValueFlag<std::string>& library_flag);

} // namespace r3lr0tool::commands
