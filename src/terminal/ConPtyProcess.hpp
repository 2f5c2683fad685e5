#ifndef __FT_CONPTY_PROCESS_HPP__
#define __FT_CONPTY_PROCESS_HPP__

#include "ProcessAdapter.hpp"

namespace ft {
/**
 * @brief ProcessAdapter backed by the Windows pseudo console (ConPTY).
 *
 * Input and output travel over two anonymous pipes handed to
 * CreatePseudoConsole; the child is started with the pseudo console attached
 * through its startup attribute list.
 */
class ConPtyProcess : public ProcessAdapter {
 public:
  ConPtyProcess();
  virtual ~ConPtyProcess();

  virtual void spawn(const ShellLaunch& launch, const TerminalInfo& size);
  virtual ReadStatus read(string* data);
  virtual void write(const string& data);
  virtual void resize(const TerminalInfo& size);
  virtual void terminate();
  virtual void close();
  virtual bool isAlive();
  virtual int64_t getPid() { return processId; }

 protected:
  void closeHandle(HANDLE* handle);

  recursive_mutex stateMutex;
  HPCON hPC;
  HANDLE inputWriteSide;
  HANDLE outputReadSide;
  HANDLE processHandle;
  int64_t processId;
  bool spawned;
};
}  // namespace ft

#endif  // __FT_CONPTY_PROCESS_HPP__
