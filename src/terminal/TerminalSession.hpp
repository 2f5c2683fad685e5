#ifndef __FT_TERMINAL_SESSION_HPP__
#define __FT_TERMINAL_SESSION_HPP__

#include "ControlFrame.hpp"
#include "FrameSocket.hpp"
#include "Headers.hpp"
#include "ProcessAdapter.hpp"

namespace ft {
/**
 * @brief One live pairing of a terminal connection and its shell process.
 *
 * run() owns both pumps: shell output is forwarded from a dedicated thread as
 * binary frames, and inbound frames are handled on the calling thread.  When
 * either side ends, run() closes the connection, joins the output pump and
 * closes the adapter before returning.
 */
class TerminalSession {
 public:
  TerminalSession(const string& _id, shared_ptr<ProcessAdapter> _adapter,
                  shared_ptr<FrameSocket> _socket,
                  const TerminalInfo& _dimensions);
  ~TerminalSession();

  /**
   * @brief Pumps data until the connection closes or the shell exits.
   * @param banner Sent to the client before any shell output (may be empty).
   */
  void run(const string& banner);

  /** @brief Asks a running session to end (close code 1001). */
  void shutdown();

  /**
   * @brief Types command followed by a newline into the shell, exactly as if
   * the client had sent it.
   * @throws std::runtime_error when the session is closed or the write fails.
   */
  void writeCommand(const string& command);

  bool isPromptWatcherEnabled();
  void setPromptWatcherEnabled(bool enabled);
  TerminalInfo getDimensions();
  const string& getId() { return id; }
  /** @brief True once run() has released the process. */
  bool isFinished() { return finished; }

 protected:
  void runOutputPump();
  void handleFrame(const string& frame);
  void writeToProcess(const string& data);

  string id;
  shared_ptr<ProcessAdapter> adapter;
  shared_ptr<FrameSocket> socket;
  /** @brief Guards dimensions, promptWatcherEnabled and shuttingDown. */
  recursive_mutex stateMutex;
  TerminalInfo dimensions;
  bool promptWatcherEnabled;
  bool shuttingDown;
  /**
   * @brief Keeps client input and injected commands from interleaving, and
   * is held while the adapter is closed.
   */
  mutex inputMutex;
  std::atomic<bool> finished;
};
}  // namespace ft

#endif  // __FT_TERMINAL_SESSION_HPP__
