#ifndef __FT_PROCESS_ADAPTER_HPP__
#define __FT_PROCESS_ADAPTER_HPP__

#include "FTerminal.pb.h"
#include "Headers.hpp"

namespace ft {
/**
 * @brief A shell running behind a pseudo-terminal.
 *
 * Exactly one implementation is compiled into a build: PosixPtyProcess on
 * unix-like systems, ConPtyProcess on Windows.  createProcessAdapter() returns
 * the one that was built.
 */
class ProcessAdapter {
 public:
  enum class ReadStatus {
    /** @brief Output was returned. */
    DATA,
    /** @brief Nothing arrived within the poll interval. */
    TIMEOUT,
    /** @brief The process has exited and its output is drained. */
    END
  };

  virtual ~ProcessAdapter() {}

  /**
   * @brief Starts the process described by launch on a terminal of the given
   * size.
   * @throws std::runtime_error when the process cannot be started.
   */
  virtual void spawn(const ShellLaunch& launch, const TerminalInfo& size) = 0;

  /**
   * @brief Waits briefly for output from the process.
   * @throws std::runtime_error on an unexpected I/O failure.
   */
  virtual ReadStatus read(string* data) = 0;

  /**
   * @brief Writes bytes to the terminal input.
   * @throws std::runtime_error when the process is gone.
   */
  virtual void write(const string& data) = 0;

  /** @brief Applies new dimensions.  Fatal if the process was never spawned. */
  virtual void resize(const TerminalInfo& size) = 0;

  /**
   * @brief Kills the process but keeps its handles open, so a writer blocked
   * on a full terminal fails instead of hanging.  Safe to call more than once.
   */
  virtual void terminate() = 0;

  /**
   * @brief Kills the process and releases its handles.  Safe to call more
   * than once.
   */
  virtual void close() = 0;

  virtual bool isAlive() = 0;

  /** @brief OS process id, or -1 before spawn. */
  virtual int64_t getPid() = 0;
};

/** @brief Creates the adapter for the platform this binary was built for. */
shared_ptr<ProcessAdapter> createProcessAdapter();
}  // namespace ft

#endif  // __FT_PROCESS_ADAPTER_HPP__
