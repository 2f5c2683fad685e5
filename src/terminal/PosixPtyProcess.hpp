#ifndef __FT_POSIX_PTY_PROCESS_HPP__
#define __FT_POSIX_PTY_PROCESS_HPP__

#include "ProcessAdapter.hpp"

namespace ft {
/**
 * @brief ProcessAdapter backed by forkpty(3).
 */
class PosixPtyProcess : public ProcessAdapter {
 public:
  PosixPtyProcess();
  virtual ~PosixPtyProcess();

  virtual void spawn(const ShellLaunch& launch, const TerminalInfo& size);
  virtual ReadStatus read(string* data);
  virtual void write(const string& data);
  virtual void resize(const TerminalInfo& size);
  virtual void terminate();
  virtual void close();
  virtual bool isAlive();
  virtual int64_t getPid() { return pid; }

 protected:
  void reap(bool block);

  /** @brief Guards masterFd and reaped. */
  recursive_mutex stateMutex;
  std::atomic<pid_t> pid;
  int masterFd;
  bool reaped;
};
}  // namespace ft

#endif  // __FT_POSIX_PTY_PROCESS_HPP__
