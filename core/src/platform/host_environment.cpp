#include "ChannelDeck/platform/host_environment.hpp"
#include "ChannelDeck/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace ChannelDeck::platform {

namespace {

std::string readEnv(const char* name) {
  const char* value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

std::string toUpper(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return text;
}

} // namespace

bool isGnomeDesktop(const std::string& xdgCurrentDesktop, const std::string& gnomeSessionId) {
  if (!gnomeSessionId.empty()) {
    return true;
  }

  std::istringstream stream(xdgCurrentDesktop);
  std::string desktop;
  while (std::getline(stream, desktop, ':')) {
    // Also matches variants such as "ubuntu:GNOME" and "GNOME-Classic"
    if (toUpper(desktop).rfind("GNOME", 0) == 0) {
      return true;
    }
  }
  return false;
}

HostEnvironment HostEnvironment::detect() {
  HostEnvironment env;
#if defined(_WIN32)
  env.isWindows = true;
#endif
  env.isGnomeSession =
      !env.isWindows &&
      isGnomeDesktop(readEnv("XDG_CURRENT_DESKTOP"), readEnv("GNOME_DESKTOP_SESSION_ID"));

  CHANNELDECK_LOG_DEBUG("Host environment: windows={}, gnome_session={}", env.isWindows,
                        env.isGnomeSession);
  return env;
}

} // namespace ChannelDeck::platform
