#ifndef __FT_SHELL_RESOLVER_HPP__
#define __FT_SHELL_RESOLVER_HPP__

#include "FTerminal.pb.h"
#include "Headers.hpp"

namespace ft {
/**
 * @brief Turns the configured shell settings into a concrete launch request.
 */
class ShellResolver {
 public:
  /**
   * @brief Builds the program, arguments, working directory and environment
   * for the platform this binary was built for.
   */
  static ShellLaunch resolve(const ShellSettings& settings);

  /**
   * @brief Same as resolve() but for an explicit platform, so both branches
   * can be exercised anywhere.
   * @param posixShell Value of $SHELL (may be empty).
   * @param homeDirectory Directory used when no root_dir is configured.
   */
  static ShellLaunch resolveFor(bool windows, const ShellSettings& settings,
                                const string& posixShell,
                                const string& homeDirectory);

  /** @brief Parses "bash", "cmd", "powershell" or "wsl" (any case). */
  static optional<ShellType> parseShellType(const string& name);

  static string shellTypeName(ShellType type);

  /** @brief The user's home directory, or "" when it cannot be found. */
  static string getHomeDirectory();

  /**
   * @brief The red failure banner with troubleshooting hints that is sent to
   * a terminal client when its shell could not be started.
   */
  static string spawnFailureBanner(const string& error, bool windows);

  /** @brief The green banner sent once the shell is running. */
  static string connectedBanner(const ShellSettings& settings);
};
}  // namespace ft

#endif  // __FT_SHELL_RESOLVER_HPP__
