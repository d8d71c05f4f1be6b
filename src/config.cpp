#include "ctapauth/config.h"

#include <pwd.h>
#include <unistd.h>

#include <cstdlib>

namespace ctapauth {

std::string default_storage_path() {
  const char* home = getenv("HOME");
  if (!home) {
    struct passwd* pw = getpwuid(getuid());
    if (pw) {
      home = pw->pw_dir;
    }
  }
  if (!home) {
    return "/tmp/ctapauth/credentials.sealed";
  }
  return std::string(home) + "/.local/share/ctapauth/credentials.sealed";
}

void init_logging(spdlog::level::level_enum level) {
  spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(level);
}

}  // namespace ctapauth
