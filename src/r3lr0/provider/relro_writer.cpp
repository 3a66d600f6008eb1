#include "r3lr0/provider/relro_writer.hpp"

#include <cerrno>
#include <csignal>
#include <thread>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "r3lbase/file_utils.hpp"
#include "r3lr0/loader/relro_loader.hpp"
#include "r3lr0/relro/snapshot.hpp"
#include "r3lr0/reserve/address_space.hpp"

namespace r3lr0::provider {
namespace {

constexpr std::chrono::milliseconds kPollInterval{10};

// a child killed or crashing is reported like an unknown waiting failure
load_status status_from_exit(int wait_status) {
  if (WIFEXITED(wait_status)) {
    return static_cast<load_status>(WEXITSTATUS(wait_status));
  }
  return load_status::failed_waiting_unknown;
}

} // namespace

forked_relro_writer::forked_relro_writer(reserve::address_space_reservation& reservation,
                                         std::chrono::milliseconds timeout)
    : reservation_(reservation), timeout_(timeout), log_(redlog::get_logger("r3lr0.writer")) {}

load_status forked_relro_writer::prepare(elf_width width, const std::string& lib_path, const std::string& relro_path) {
  if (!can_serve(width)) {
    log_.dbg("cannot create relro for another width", redlog::field("width", to_string(width)));
    return load_status::failed_to_load_library;
  }
  if (!reservation_.reserved()) {
    log_.wrn("address space not reserved, skipping relro creation");
    return load_status::address_space_not_reserved;
  }

  const pid_t child = fork();
  if (child < 0) {
    log_.err("failed to fork relro writer", redlog::field("error", util::errno_text()));
    return load_status::failed_waiting_unknown;
  }

  if (child == 0) {
    loader::relro_loader writer(reservation_);
    const load_status result = writer.create_relro_file(lib_path, relro_path);
    _exit(to_int(result));
  }

  log_.vrb("started relro writer", redlog::field("pid", child), redlog::field("library", lib_path),
           redlog::field("snapshot", relro_path));

  const auto deadline = std::chrono::steady_clock::now() + timeout_;
  int wait_status = 0;
  for (;;) {
    const pid_t done = waitpid(child, &wait_status, WNOHANG);
    if (done == child) {
      break;
    }
    if (done < 0 && errno != EINTR) {
      log_.err("failed waiting for relro writer", redlog::field("error", util::errno_text()));
      return load_status::failed_waiting_unknown;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      log_.err("relro writer timed out, killing it", redlog::field("pid", child),
               redlog::field("timeout_ms", static_cast<long long>(timeout_.count())));
      kill(child, SIGKILL);
      while (waitpid(child, &wait_status, 0) < 0 && errno == EINTR) {
      }
      // the child may have died between creating and renaming its staging file
      const std::string staged = relro::staging_path(relro_path);
      if (::unlink(staged.c_str()) == 0) {
        log_.vrb("removed partial snapshot", redlog::field("path", staged));
      }
      return load_status::failed_waiting_for_relro;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  const load_status result = status_from_exit(wait_status);
  if (result == load_status::success) {
    log_.inf("relro writer finished", redlog::field("snapshot", relro_path));
  } else {
    log_.err("relro writer failed", redlog::field("status", to_string(result)), redlog::field("raw", wait_status));
  }
  return result;
}

} // namespace r3lr0::provider
