#include "ShellResolver.hpp"

namespace ft {
namespace {
void addEnvironment(ShellLaunch* launch, const string& name,
                    const string& value) {
  launch->add_environment_names(name);
  launch->add_environment_values(value);
}

#ifdef WIN32
const bool BUILT_FOR_WINDOWS = true;
#else
const bool BUILT_FOR_WINDOWS = false;
#endif
}  // namespace

ShellLaunch ShellResolver::resolve(const ShellSettings& settings) {
  const char* shellEnv = ::getenv("SHELL");
  return resolveFor(BUILT_FOR_WINDOWS, settings,
                    shellEnv ? string(shellEnv) : string(),
                    getHomeDirectory());
}

ShellLaunch ShellResolver::resolveFor(bool windows,
                                      const ShellSettings& settings,
                                      const string& posixShell,
                                      const string& homeDirectory) {
  ShellLaunch launch;
  bool wsl = false;
  if (windows) {
    switch (settings.type()) {
      case SHELL_WSL: {
        wsl = true;
        launch.set_program("wsl.exe");
        if (!settings.wsl_distro().empty()) {
          launch.add_arguments("-d");
          launch.add_arguments(settings.wsl_distro());
        }
        if (!settings.wsl_user().empty()) {
          launch.add_arguments("-u");
          launch.add_arguments(settings.wsl_user());
        }
        launch.add_arguments("--cd");
        launch.add_arguments(settings.root_dir().empty() ? "~"
                                                         : settings.root_dir());
        launch.add_arguments("-e");
        launch.add_arguments("bash");
        launch.add_arguments("-l");
        break;
      }
      case SHELL_POWERSHELL:
        launch.set_program("powershell.exe");
        break;
      default:
        launch.set_program("cmd.exe");
        break;
    }
  } else {
    launch.set_program(posixShell.empty() ? "/bin/bash" : posixShell);
    launch.add_arguments("-l");
  }

  // The WSL root directory is a path inside the distro, handled by --cd.
  if (!wsl && !settings.root_dir().empty()) {
    launch.set_working_directory(settings.root_dir());
  } else if (!homeDirectory.empty()) {
    launch.set_working_directory(homeDirectory);
  }

  addEnvironment(&launch, "TERM", "xterm-256color");
  addEnvironment(&launch, "COLORTERM", "truecolor");
  VLOG(1) << "Resolved shell " << launch.program() << " in "
          << launch.working_directory();
  return launch;
}

optional<ShellType> ShellResolver::parseShellType(const string& name) {
  string lowered = asciiToLower(trim(name));
  if (lowered.empty() || lowered == "default") {
    return SHELL_DEFAULT;
  }
  if (lowered == "bash") {
    return SHELL_BASH;
  }
  if (lowered == "cmd") {
    return SHELL_CMD;
  }
  if (lowered == "powershell") {
    return SHELL_POWERSHELL;
  }
  if (lowered == "wsl") {
    return SHELL_WSL;
  }
  return std::nullopt;
}

string ShellResolver::shellTypeName(ShellType type) {
  switch (type) {
    case SHELL_BASH:
      return "bash";
    case SHELL_CMD:
      return "cmd";
    case SHELL_POWERSHELL:
      return "powershell";
    case SHELL_WSL:
      return "wsl";
    default:
      return BUILT_FOR_WINDOWS ? "cmd" : "bash";
  }
}

string ShellResolver::getHomeDirectory() {
#ifdef WIN32
  const char* profile = ::getenv("USERPROFILE");
  return profile ? string(profile) : string();
#else
  passwd* pwd = getpwuid(getuid());
  if (pwd != NULL && pwd->pw_dir != NULL) {
    return string(pwd->pw_dir);
  }
  const char* home = ::getenv("HOME");
  return home ? string(home) : string();
#endif
}

string ShellResolver::spawnFailureBanner(const string& error, bool windows) {
  string banner = "\r\n\x1b[31m✗ Failed to create terminal session\x1b[0m\r\n\r\n";
  banner += "Error: " + error + "\r\n\r\n";
  banner += "\x1b[33mTroubleshooting:\x1b[0m\r\n";
  if (windows) {
    banner += "• Check that PowerShell, CMD, or WSL is installed\r\n";
    banner += "• For WSL: Verify WSL is installed with 'wsl --list'\r\n";
    banner += "• Try a different [Shell] type in the server config\r\n";
  } else {
    banner += "• Check that bash or your default shell is installed\r\n";
    banner += "• Verify SHELL environment variable is set correctly\r\n";
  }
  return banner;
}

string ShellResolver::connectedBanner(const ShellSettings& settings) {
  return "\x1b[32m✓ Connected to terminal\x1b[0m (Shell: " +
         shellTypeName(settings.type()) + ")\r\n";
}
}  // namespace ft
