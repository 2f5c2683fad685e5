#include <cxxopts.hpp>

#include "ConnectionController.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PseudoTerminalConsole.hpp"
#include "RawSocketUtils.hpp"
#include "Scheduler.hpp"
#include "WebSocketClientTransport.hpp"

using namespace ft;

namespace {
// ctrl-], as in telnet.
const char ESCAPE_CHAR = 0x1d;
const int INPUT_POLL_MS = 100;

string describeState(ConnectionState state, int attempt) {
  switch (state) {
    case ConnectionState::CONNECTING:
      return "Connecting...";
    case ConnectionState::CONNECTED:
      return "Connected";
    case ConnectionState::RECONNECTING:
      return "Connection lost, reconnecting (attempt " + to_string(attempt) +
             ")...";
    case ConnectionState::FAILED:
      return "Connection failed.  Press r to retry or q to quit.";
    case ConnectionState::DISCONNECTED:
      return "Disconnected";
  }
  return connectionStateName(state);
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  ft::HandleTerminate();
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("ftclient",
                           "Attach the local terminal to an ftserver shell");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Server to connect to",
         cxxopts::value<string>()->default_value("127.0.0.1"))  //
        ("port", "Port the server listens on",
         cxxopts::value<int>()->default_value("8080"))  //
        ("origin", "Origin header to present",
         cxxopts::value<string>()->default_value("http://localhost:8080"))  //
        ("promptwatcher",
         "Automatically answer confirmation prompts")  //
        ("logtostdout", "log to stdout")               //
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
      CLOG(INFO, "stdout") << "ftclient version " << FT_VERSION << endl;
      exit(0);
    }
    if (result.count("verbose")) {
      LogHandler::setVerboseLevel(result["verbose"].as<int>());
    }

    string logDirectory = result["logdir"].as<string>();
    if (logDirectory.empty()) {
      logDirectory = GetTempDirectory() + "forgeterm";
    }
    // stdout belongs to the remote shell, so only log there when asked.
    LogHandler::setupLogFiles(&defaultConf, logDirectory, "ftclient",
                              result.count("logtostdout") > 0,
                              !result.count("logtostdout"));
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("ftclient-main");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    int port = result["port"].as<int>();
    if (port <= 0 || port > 65535) {
      STFATAL << "Port out of range: " << port;
    }
    SocketEndpoint serverEndpoint;
    serverEndpoint.set_name(result["host"].as<string>());
    serverEndpoint.set_port(port);

    shared_ptr<Console> console;
    if (::isatty(STDIN_FILENO)) {
      console.reset(new PseudoTerminalConsole());
    } else {
      STFATAL << "ftclient needs a terminal on stdin";
    }

    auto scheduler = make_shared<TimerThreadScheduler>();
    auto transport = make_shared<WebSocketClientTransport>(
        serverEndpoint, "/ws/pty", result["origin"].as<string>());
    auto controller = make_shared<ConnectionController>(transport, scheduler);

    controller->setOutputListener(
        [console](const string& output) { console->write(output); });
    std::weak_ptr<ConnectionController> weakController = controller;
    controller->setStateListener(
        [console, weakController](ConnectionState state) {
          auto strongController = weakController.lock();
          int attempt = strongController ? strongController->getAttempt() : 0;
          LOG(INFO) << "Connection state: " << connectionStateName(state);
          try {
            console->write("\r\n[ftclient] " + describeState(state, attempt) +
                           "\r\n");
          } catch (const std::runtime_error& re) {
            LOG(WARNING) << "Could not write to console: " << re.what();
          }
        });

    TerminalInfo lastTerminalInfo = console->getTerminalInfo();
    controller->setTerminalSize(lastTerminalInfo);
    if (result.count("promptwatcher")) {
      controller->setPromptWatcherEnabled(true);
    }

    console->setup();
    controller->connect();

    while (true) {
      ConnectionState state = controller->getState();
      if (state == ConnectionState::DISCONNECTED) {
        break;
      }

      if (RawSocketUtils::waitOnData(console->getInputFd(), INPUT_POLL_MS)) {
        char buf[4096];
        ssize_t rc = ::read(console->getInputFd(), buf, sizeof(buf));
        if (rc == 0) {
          LOG(INFO) << "stdin closed";
          break;
        }
        if (rc < 0) {
          if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
            continue;
          }
          STERROR << "Error reading stdin: " << strerror(GetErrno());
          break;
        }
        string input(buf, rc);
        if (input.find(ESCAPE_CHAR) != string::npos) {
          break;
        }
        if (state == ConnectionState::FAILED) {
          if (input[0] == 'r' || input[0] == 'R') {
            controller->retry();
          } else if (input[0] == 'q' || input[0] == 'Q') {
            break;
          }
        } else {
          controller->sendInput(input);
        }
      }

      TerminalInfo terminalInfo = console->getTerminalInfo();
      if (terminalInfo != lastTerminalInfo) {
        LOG(INFO) << "Window size changed: " << terminalInfo.row() << "x"
                  << terminalInfo.column();
        controller->setTerminalSize(terminalInfo);
        lastTerminalInfo = terminalInfo;
      }
    }

    controller->disconnect();
    // No timer may fire into a controller that is being torn down.
    scheduler->stop();
    console->teardown();
    controller.reset();
    transport.reset();
    CLOG(INFO, "stdout") << endl << "Session ended" << endl;
  } catch (const cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}
