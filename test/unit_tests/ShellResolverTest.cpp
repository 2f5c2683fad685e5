#include "ShellResolver.hpp"
#include "TestHeaders.hpp"

using namespace ft;

namespace {
string environmentValue(const ShellLaunch& launch, const string& name) {
  for (int a = 0; a < launch.environment_names_size(); a++) {
    if (launch.environment_names(a) == name) {
      return launch.environment_values(a);
    }
  }
  return "";
}

vector<string> arguments(const ShellLaunch& launch) {
  return vector<string>(launch.arguments().begin(), launch.arguments().end());
}
}  // namespace

TEST_CASE("Unix shells come from $SHELL", "[ShellResolver]") {
  ShellSettings settings;
  auto launch =
      ShellResolver::resolveFor(false, settings, "/usr/bin/zsh", "/home/dev");
  REQUIRE(launch.program() == "/usr/bin/zsh");
  REQUIRE(arguments(launch) == vector<string>{"-l"});
  REQUIRE(launch.working_directory() == "/home/dev");
  REQUIRE(environmentValue(launch, "TERM") == "xterm-256color");
  REQUIRE(environmentValue(launch, "COLORTERM") == "truecolor");

  auto fallback = ShellResolver::resolveFor(false, settings, "", "/home/dev");
  REQUIRE(fallback.program() == "/bin/bash");

  settings.set_root_dir("/srv/project");
  auto rooted =
      ShellResolver::resolveFor(false, settings, "/bin/bash", "/home/dev");
  REQUIRE(rooted.working_directory() == "/srv/project");
}

TEST_CASE("Windows shells follow the configured type", "[ShellResolver]") {
  ShellSettings settings;
  settings.set_type(SHELL_POWERSHELL);
  REQUIRE(ShellResolver::resolveFor(true, settings, "", "C:\\Users\\dev")
              .program() == "powershell.exe");

  settings.set_type(SHELL_CMD);
  auto cmd = ShellResolver::resolveFor(true, settings, "", "C:\\Users\\dev");
  REQUIRE(cmd.program() == "cmd.exe");
  REQUIRE(cmd.working_directory() == "C:\\Users\\dev");

  settings.set_type(SHELL_DEFAULT);
  REQUIRE(ShellResolver::resolveFor(true, settings, "", "").program() ==
          "cmd.exe");
}

TEST_CASE("WSL gets its distro, user and directory as arguments",
          "[ShellResolver]") {
  ShellSettings settings;
  settings.set_type(SHELL_WSL);
  auto plain = ShellResolver::resolveFor(true, settings, "", "C:\\Users\\dev");
  REQUIRE(plain.program() == "wsl.exe");
  REQUIRE(arguments(plain) ==
          vector<string>{"--cd", "~", "-e", "bash", "-l"});

  settings.set_wsl_distro("Ubuntu-22.04");
  settings.set_wsl_user("dev");
  settings.set_root_dir("/home/dev/src");
  auto full = ShellResolver::resolveFor(true, settings, "", "C:\\Users\\dev");
  REQUIRE(arguments(full) ==
          vector<string>{"-d", "Ubuntu-22.04", "-u", "dev", "--cd",
                         "/home/dev/src", "-e", "bash", "-l"});
  // The root directory lives inside the distro, not on the host.
  REQUIRE(full.working_directory() == "C:\\Users\\dev");
}

TEST_CASE("Shell type names parse case-insensitively", "[ShellResolver]") {
  REQUIRE(ShellResolver::parseShellType("PowerShell") == SHELL_POWERSHELL);
  REQUIRE(ShellResolver::parseShellType(" wsl ") == SHELL_WSL);
  REQUIRE(ShellResolver::parseShellType("bash") == SHELL_BASH);
  REQUIRE(ShellResolver::parseShellType("cmd") == SHELL_CMD);
  REQUIRE(ShellResolver::parseShellType("") == SHELL_DEFAULT);
  REQUIRE_FALSE(ShellResolver::parseShellType("fish").has_value());
  REQUIRE(ShellResolver::shellTypeName(SHELL_WSL) == "wsl");
}

TEST_CASE("Banners", "[ShellResolver]") {
  ShellSettings settings;
  settings.set_type(SHELL_POWERSHELL);
  string connected = ShellResolver::connectedBanner(settings);
  REQUIRE(connected.find("Connected to terminal") != string::npos);
  REQUIRE(connected.find("Shell: powershell") != string::npos);

  string failure =
      ShellResolver::spawnFailureBanner("No such file or directory", true);
  REQUIRE(failure.find("\x1b[31m") != string::npos);
  REQUIRE(failure.find("Error: No such file or directory") != string::npos);
  REQUIRE(failure.find("wsl --list") != string::npos);
  REQUIRE(ShellResolver::spawnFailureBanner("boom", false).find("wsl") ==
          string::npos);
}
