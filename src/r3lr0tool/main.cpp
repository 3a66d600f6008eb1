#include <cstdlib>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "r3lbase/cli/verbosity.hpp"

#include "commands/create_relro.hpp"
#include "commands/inspect_relro.hpp"
#include "commands/load.hpp"
#include "commands/resolve_paths.hpp"
#include "commands/tunables.hpp"
#include "commands/vmsize.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { r3lr0::cli::apply_verbosity(args::get(verbosity_flag)); }
} // namespace cli

namespace {
auto log_main = redlog::get_logger("r3lr0tool");
int g_exit_code = 0;
} // namespace

void cmd_create_relro(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> library(parser, "path", "provider library (file or archive!/entry)", {'l', "library"});
  args::ValueFlag<std::string> output(parser, "path", "snapshot file to write", {'o', "output"});
  args::ValueFlag<uint64_t> vm_size(parser, "bytes", "reservation size (default: tunable)", {'s', "vm-size"});
  args::ValueFlag<std::string> property_file(parser, "path", "tunable store", {"property-file"});
  parser.Parse();

  g_exit_code = r3lr0tool::commands::create_relro(library, output, vm_size, property_file);
}

void cmd_load(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> library(parser, "path", "provider library (file or archive!/entry)", {'l', "library"});
  args::ValueFlag<std::string> relro(parser, "path", "relro snapshot to share", {'r', "relro"});
  args::ValueFlag<uint64_t> vm_size(parser, "bytes", "reservation size (default: tunable)", {'s', "vm-size"});
  args::ValueFlag<std::string> property_file(parser, "path", "tunable store", {"property-file"});
  args::Flag write_first(parser, "write-first", "create the snapshot in a forked writer before loading", {'w', "write-first"});
  args::Flag no_reserve(parser, "no-reserve", "skip the reservation and load privately", {"no-reserve"});
  args::ValueFlagList<std::string> symbols(parser, "name", "symbol to look up after loading", {"symbol"});
  parser.Parse();

  g_exit_code =
      r3lr0tool::commands::load(library, relro, vm_size, property_file, write_first, no_reserve, symbols);
}

void cmd_inspect_relro(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> file(parser, "path", "path to relro snapshot", {'f', "file"});
  args::ValueFlag<std::string> library(parser, "path", "check the snapshot against this library", {'l', "library"});
  parser.Parse();

  g_exit_code = r3lr0tool::commands::inspect_relro(file, library);
}

void cmd_resolve_paths(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> source(parser, "path", "package archive", {"source"});
  args::ValueFlag<std::string> primary_abi(parser, "abi", "primary cpu abi", {"primary-abi"});
  args::ValueFlag<std::string> secondary_abi(parser, "abi", "secondary cpu abi", {"secondary-abi"});
  args::ValueFlag<std::string> primary_dir(parser, "dir", "primary native library dir", {"primary-dir"});
  args::ValueFlag<std::string> secondary_dir(parser, "dir", "secondary native library dir", {"secondary-dir"});
  args::ValueFlag<std::string> file_name(parser, "name", "library file name", {'n', "name"});
  parser.Parse();

  g_exit_code = r3lr0tool::commands::resolve_paths(source, primary_abi, secondary_abi, primary_dir, secondary_dir,
                                                   file_name);
}

void cmd_vmsize(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> property_file(parser, "path", "tunable store", {"property-file"});
  args::ValueFlag<uint64_t> set(parser, "bytes", "store a new reservation size", {"set"});
  args::ValueFlag<std::string> library32(parser, "path", "32-bit library to size the reservation for", {"library32"});
  args::ValueFlag<std::string> library64(parser, "path", "64-bit library to size the reservation for", {"library64"});
  args::Flag store(parser, "store", "store the computed size", {"store"});
  parser.Parse();

  g_exit_code = r3lr0tool::commands::vmsize(property_file, set, library32, library64, store);
}

void cmd_tunables(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> property_file(parser, "path", "tunable store", {"property-file"});
  args::ValueFlag<uint64_t> vm_size(parser, "bytes", "reservation size override", {'s', "vm-size"});
  parser.Parse();

  g_exit_code = r3lr0tool::commands::tunables(property_file, vm_size);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "r3lr0tool - shared relro provider loader", "create, share and inspect relocated provider library snapshots"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command create_relro_cmd(
      commands, "create-relro", "load a library at the reservation and write its relro snapshot", &cmd_create_relro
  );
  args::Command load_cmd(commands, "load", "load a library, sharing relro with a snapshot", &cmd_load);
  args::Command inspect_relro_cmd(commands, "inspect-relro", "show and validate a relro snapshot", &cmd_inspect_relro);
  args::Command resolve_paths_cmd(
      commands, "resolve-paths", "resolve 32/64-bit library paths for a package layout", &cmd_resolve_paths
  );
  args::Command vmsize_cmd(commands, "vmsize", "show, compute or store the reservation size", &cmd_vmsize);
  args::Command tunables_cmd(commands, "tunables", "list stored tunables and the requested reservation", &cmd_tunables);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  if (g_exit_code != 0) {
    log_main.dbg("command failed", redlog::field("exit_code", g_exit_code));
  }
  return g_exit_code;
}
