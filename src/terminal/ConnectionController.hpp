#ifndef __FT_CONNECTION_CONTROLLER_HPP__
#define __FT_CONNECTION_CONTROLLER_HPP__

#include "Headers.hpp"
#include "PromptDetector.hpp"
#include "Scheduler.hpp"
#include "Transport.hpp"

namespace ft {
enum class ConnectionState {
  DISCONNECTED,
  CONNECTING,
  CONNECTED,
  RECONNECTING,
  FAILED
};

string connectionStateName(ConnectionState state);

struct ReconnectPolicy {
  /** @brief Retryable closes tolerated before giving up. */
  int maxAttempts;
  std::chrono::milliseconds baseDelay;
  std::chrono::milliseconds maxDelay;
  /** @brief Quiet period after output before the prompt detector runs. */
  std::chrono::milliseconds debounce;
  /** @brief Tail of the output kept for prompt detection. */
  size_t maxBufferLength;

  ReconnectPolicy()
      : maxAttempts(5),
        baseDelay(1000),
        maxDelay(30000),
        debounce(500),
        maxBufferLength(3000) {}
};

/**
 * @brief Client side of a terminal connection: reconnection with exponential
 * backoff, and the prompt watcher that answers confirmation prompts.
 *
 * Retryable closes (1001, 1006, 1011, 1012, 1013) schedule a reconnect after
 * min(base * 2^attempt, cap).  When maxAttempts consecutive retryable closes
 * happen without a successful open, the state becomes FAILED and only retry()
 * leaves it.  Any other close code ends in DISCONNECTED.
 */
class ConnectionController : public TransportListener {
 public:
  typedef std::function<void(ConnectionState)> StateListener;
  typedef std::function<void(const string&)> OutputListener;

  ConnectionController(shared_ptr<Transport> _transport,
                       shared_ptr<Scheduler> _scheduler,
                       const ReconnectPolicy& _policy = ReconnectPolicy());
  virtual ~ConnectionController();

  void setStateListener(StateListener _stateListener);
  void setOutputListener(OutputListener _outputListener);

  /** @brief DISCONNECTED -> CONNECTING. */
  void connect();
  /** @brief FAILED or DISCONNECTED -> CONNECTING with a fresh attempt count. */
  void retry();
  /** @brief Closes normally and cancels any pending reconnect. */
  void disconnect();

  /** @brief Sends keystrokes as an input frame.  Dropped unless connected. */
  void sendInput(const string& data);
  /** @brief Remembers the size and sends a resize frame when connected. */
  void setTerminalSize(const TerminalInfo& size);
  void setPromptWatcherEnabled(bool enabled);
  bool isPromptWatcherEnabled();

  ConnectionState getState();
  int getAttempt();

  static bool isRetryable(uint16_t code);
  static std::chrono::milliseconds backoffDelay(const ReconnectPolicy& policy,
                                                int attempt);

  virtual void onOpen();
  virtual void onMessage(const string& frame);
  virtual void onClose(const CloseReason& reason);

 protected:
  void setStateLocked(ConnectionState newState);
  void notifyState(ConnectionState newState);
  void reconnectNow();
  void runPromptCheck();
  void sendFrame(const string& frame);

  shared_ptr<Transport> transport;
  shared_ptr<Scheduler> scheduler;
  ReconnectPolicy policy;
  StateListener stateListener;
  OutputListener outputListener;

  recursive_mutex controllerMutex;
  ConnectionState state;
  int attempt;
  Scheduler::TimerId backoffTimer;
  Scheduler::TimerId debounceTimer;
  TerminalInfo terminalSize;
  bool promptWatcherEnabled;
  string outputBuffer;
};
}  // namespace ft

#endif  // __FT_CONNECTION_CONTROLLER_HPP__
