#ifndef __FT_LOG_HANDLER__
#define __FT_LOG_HANDLER__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Owns the easylogging++ setup shared by ftserver, ftclient and the
 * tests.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the baseline configuration that the
   * caller finishes (log files, stdout) before reconfiguring "default".
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file under @p directory.
   * @param filenamePrefix Prefix of the file, e.g. "ftserver".
   * @param logToStdout Mirror every log line to stdout as well.
   * @param redirectStderrToFile Send stderr to a sibling "-stderr" file.
   * @param maxlogsize Rollover threshold in bytes, as easylogging expects it.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const string &directory,
                            const string &filenamePrefix, bool logToStdout,
                            bool redirectStderrToFile,
                            const string &maxlogsize = "20971520");

  /** @brief Deletes a log file that easylogging just rolled over. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Makes the "stdout" logger print bare messages for user output. */
  static void setupStdoutLogger();

  /** @brief Sets the global VLOG level. */
  static void setVerboseLevel(int level);

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace ft
#endif  // __FT_LOG_HANDLER__
