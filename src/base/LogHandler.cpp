#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace ft {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts/the config file, not easylogging's own
  // argument parsing, but START_EASYLOGGINGPP still needs to run once.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &directory,
                               const string &filenamePrefix, bool logToStdout,
                               bool redirectStderrToFile,
                               const string &maxlogsize) {
  char buffer[80];
  time_t rawtime = time(NULL);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", localtime(&rawtime));
  string suffix = string(buffer) + "_" + to_string(getpid()) + ".log";

  string logFilename =
      createLogFile(directory, filenamePrefix + "-" + suffix);
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logFilename);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    string stderrFilename =
        createLogFile(directory, filenamePrefix + "-stderr-" + suffix);
    FILE *stderrStream = freopen(stderrFilename.c_str(), "w", stderr);
    if (!stderrStream) {
      STFATAL << "Invalid filename " << stderrFilename;
    }
    setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed at this point, so logging here is not possible.
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::setVerboseLevel(int level) {
  el::Loggers::setVerboseLevel(level);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory: " << fse.what()
                          << endl;
    exit(1);
  }
#ifdef WIN32
  int fd = ::_open(fullFname.c_str(), _O_EXCL | _O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::_close(fd);
#else
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
#endif
  return fullFname;
}
}  // namespace ft
