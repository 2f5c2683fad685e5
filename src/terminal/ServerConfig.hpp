#ifndef __FT_SERVER_CONFIG_HPP__
#define __FT_SERVER_CONFIG_HPP__

#include "FT.pb.h"
#include "FTerminal.pb.h"
#include "Headers.hpp"

namespace ft {
/**
 * @brief ftserver settings, from defaults, then the INI file, then the
 * environment.  Command line flags are applied on top by the caller.
 *
 *   [Networking] port, bind_ip
 *   [Shell]      type, wsl_distro, wsl_user, root_dir
 *   [Security]   allowed_origins (comma separated)
 *   [Debug]      verbose, silent, logsize
 */
struct ServerConfig {
  SocketEndpoint endpoint;
  ShellSettings shell;
  vector<string> allowedOrigins;
  int verbose;
  bool silent;
  string maxLogSize;

  ServerConfig();

  /** @throws std::runtime_error when the file is unreadable or invalid. */
  void loadIniFile(const string& filename);

  /**
   * @brief Replaces the origin allow-list with FORGETERM_ALLOWED_ORIGINS when
   * that variable is set and non-empty.
   * @return true when the environment won.
   */
  bool applyEnvironment();

  /** @brief <config home>/forgeterm/ftserver.ini */
  static string defaultConfigPath();
};
}  // namespace ft

#endif  // __FT_SERVER_CONFIG_HPP__
