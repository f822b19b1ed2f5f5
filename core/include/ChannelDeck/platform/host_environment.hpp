#pragma once

#include <string>

namespace ChannelDeck::platform {

/**
 * @brief Facts about the hosting desktop that change dialog presentation
 *
 * - isWindows: builder markup is translated before loading, since the
 *   toolkit's own markup translation is not used there
 * - isGnomeSession: dialogs show their in-window header
 */
struct HostEnvironment {
  bool isWindows = false;
  bool isGnomeSession = false;

  /**
   * @brief Inspect the running process (compile target and environment)
   */
  static HostEnvironment detect();
};

/**
 * @brief Decide whether the session is a GNOME desktop
 * @param xdgCurrentDesktop Value of XDG_CURRENT_DESKTOP (colon separated list)
 * @param gnomeSessionId Value of GNOME_DESKTOP_SESSION_ID
 */
[[nodiscard]] bool isGnomeDesktop(const std::string& xdgCurrentDesktop,
                                  const std::string& gnomeSessionId);

} // namespace ChannelDeck::platform
