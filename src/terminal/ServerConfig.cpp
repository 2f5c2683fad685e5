#include "ServerConfig.hpp"

#include "OriginPolicy.hpp"
#include "ShellResolver.hpp"
#include "SimpleIni.h"

namespace ft {
namespace {
const int DEFAULT_PORT = 8080;
const char* DEFAULT_BIND_IP = "127.0.0.1";
const char* ORIGINS_ENV = "FORGETERM_ALLOWED_ORIGINS";

int parseInt(const string& section, const string& key, const char* value) {
  try {
    size_t used = 0;
    int result = std::stoi(value, &used);
    if (used == strlen(value)) {
      return result;
    }
  } catch (const std::logic_error&) {
  }
  throw std::runtime_error("Invalid number for [" + section + "] " + key +
                           ": " + value);
}
}  // namespace

ServerConfig::ServerConfig() : verbose(0), silent(false), maxLogSize("20971520") {
  endpoint.set_name(DEFAULT_BIND_IP);
  endpoint.set_port(DEFAULT_PORT);
#ifdef WIN32
  shell.set_type(SHELL_CMD);
#else
  shell.set_type(SHELL_BASH);
#endif
  allowedOrigins = OriginPolicy::defaultOrigins();
}

void ServerConfig::loadIniFile(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    int port = parseInt("Networking", "port", portString);
    if (port <= 0 || port > 65535) {
      throw std::runtime_error(string("Port out of range: ") + portString);
    }
    endpoint.set_port(port);
  }
  const char* bindIp = ini.GetValue("Networking", "bind_ip", NULL);
  if (bindIp && strlen(bindIp)) {
    endpoint.set_name(bindIp);
  }

  const char* shellType = ini.GetValue("Shell", "type", NULL);
  if (shellType) {
    auto parsed = ShellResolver::parseShellType(shellType);
    if (!parsed) {
      throw std::runtime_error(string("Unknown shell type: ") + shellType);
    }
    shell.set_type(*parsed);
  }
  shell.set_wsl_distro(ini.GetValue("Shell", "wsl_distro", ""));
  shell.set_wsl_user(ini.GetValue("Shell", "wsl_user", ""));
  shell.set_root_dir(ini.GetValue("Shell", "root_dir", ""));

  const char* origins = ini.GetValue("Security", "allowed_origins", NULL);
  if (origins) {
    allowedOrigins = OriginPolicy::parseOriginList(origins);
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = parseInt("Debug", "verbose", vlevel);
  }
  const char* silentString = ini.GetValue("Debug", "silent", NULL);
  if (silentString) {
    silent = parseInt("Debug", "silent", silentString) != 0;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && parseInt("Debug", "logsize", logsize) > 0) {
    maxLogSize = string(logsize);
  }
  LOG(INFO) << "Loaded config file " << filename;
}

bool ServerConfig::applyEnvironment() {
  const char* envOrigins = ::getenv(ORIGINS_ENV);
  if (envOrigins == NULL) {
    return false;
  }
  auto origins = OriginPolicy::parseOriginList(envOrigins);
  if (origins.empty()) {
    return false;
  }
  allowedOrigins = origins;
  return true;
}

string ServerConfig::defaultConfigPath() {
  return (fs::path(sago::getConfigHome()) / "forgeterm" / "ftserver.ini")
      .string();
}
}  // namespace ft
