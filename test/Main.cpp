#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace ft;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      ft::LogHandler::setupLogHandler(&argc, &argv);
  ft::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  ft::HandleTerminate();
#ifndef WIN32
  // Sockets closed by the peer must surface as write errors, not signals.
  signal(SIGPIPE, SIG_IGN);
#endif

  string logDirectoryPattern = GetTempDirectory() + string("ft_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  ft::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", false,
                                false);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
