#include <cxxopts.hpp>

#include "Hub.hpp"
#include "LogHandler.hpp"
#include "OriginPolicy.hpp"
#include "ServerConfig.hpp"
#include "SessionRegistry.hpp"
#include "ShellResolver.hpp"
#include "TerminalServer.hpp"

using namespace ft;

#ifndef WIN32
namespace {
// SIGINT/SIGTERM are blocked in every thread and collected here so that the
// accept loop can wind down sessions instead of exiting mid-write.
void waitForStopSignal(TerminalServer* server, sigset_t signals) {
  el::Helpers::setThreadName("signal-watcher");
  int signum = 0;
  if (sigwait(&signals, &signum) != 0) {
    STERROR << "sigwait failed";
    return;
  }
  CLOG(INFO, "stdout") << "Got signal " << signum << ", shutting down" << endl;
  server->shutdown();
}
}  // namespace
#endif

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ft::HandleTerminate();

  cxxopts::Options options("ftserver",
                           "Terminal and event hub for local agent tooling");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("port", "Port to listen on",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP to listen on",
         cxxopts::value<string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("shell", "Shell to spawn (bash, cmd, powershell, wsl)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "ftserver version " << FT_VERSION << endl;
      exit(0);
    }

    ServerConfig config;
    string cfgfilename = result["cfgfile"].as<string>();
    if (cfgfilename.empty()) {
      string defaultPath = ServerConfig::defaultConfigPath();
      if (fs::exists(defaultPath)) {
        cfgfilename = defaultPath;
      }
    }
    if (!cfgfilename.empty()) {
      try {
        config.loadIniFile(cfgfilename);
      } catch (const std::runtime_error& re) {
        STFATAL << re.what();
      }
    }
    if (config.applyEnvironment()) {
      LOG(INFO) << "Allowed origins taken from the environment";
    }

    if (result.count("port")) {
      int port = result["port"].as<int>();
      if (port <= 0 || port > 65535) {
        STFATAL << "Port out of range: " << port;
      }
      config.endpoint.set_port(port);
    }
    if (result.count("bindip") && !result["bindip"].as<string>().empty()) {
      config.endpoint.set_name(result["bindip"].as<string>());
    }
    if (result.count("shell") && !result["shell"].as<string>().empty()) {
      auto shellType =
          ShellResolver::parseShellType(result["shell"].as<string>());
      if (!shellType) {
        STFATAL << "Unknown shell type: " << result["shell"].as<string>();
      }
      config.shell.set_type(*shellType);
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    LogHandler::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    string logDirectory = result["logdir"].as<string>();
    if (logDirectory.empty()) {
      logDirectory = GetTempDirectory() + "forgeterm";
    }
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "ftserver",
                              result.count("logtostdout") > 0,
                              !result.count("logtostdout"), config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("ftserver-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

#ifdef WIN32
    ::signal(SIGINT, ft::InterruptSignalHandler);
#else
    ::signal(SIGPIPE, SIG_IGN);
    sigset_t stopSignals;
    sigemptyset(&stopSignals);
    sigaddset(&stopSignals, SIGINT);
    sigaddset(&stopSignals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stopSignals, NULL);
#endif

    LOG(INFO) << "Shell: " << ShellResolver::shellTypeName(config.shell.type());
    auto originPolicy = make_shared<OriginPolicy>(config.allowedOrigins);
    auto hub = make_shared<Hub>();
    hub->start();
    auto registry = make_shared<SessionRegistry>(config.shell);

    TerminalServer terminalServer(config.endpoint, registry, hub, originPolicy);
    int boundPort = 0;
    try {
      boundPort = terminalServer.listen();
    } catch (const std::system_error& se) {
      STFATAL << "Could not listen on " << config.endpoint << ": "
              << se.what();
    }
    CLOG(INFO, "stdout") << "ftserver listening on "
                         << config.endpoint.name() << ":" << boundPort << endl;

#ifndef WIN32
    std::thread signalThread(waitForStopSignal, &terminalServer, stopSignals);
    signalThread.detach();
#endif
    terminalServer.run();
    LOG(INFO) << "ftserver stopped";
  } catch (const cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
